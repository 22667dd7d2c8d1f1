//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef COVA_ERROR_HPP
#define COVA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types for the coverage engine.
 *
 * Error categories:
 * - None: No error (success state)
 * - InvalidArgument: Invalid function arguments or options
 * - NotFound: Requested file, tool or snapshot not found
 * - ParseError: Malformed test transcript line or report node
 * - IoError: File system operation failed
 * - ConfigError: No workspace loaded, or invalid configuration
 * - DiscoveryError: Project metadata could not be read
 * - ProcessLaunchError: Test tool missing or exited unexpectedly
 * - ProcessTimeout: Test process exceeded its time limit
 * - ComparisonError: Baseline snapshot is missing or malformed
 * - Cancelled: Run was cancelled by the caller
 * - InternalError: Unexpected internal error
 *
 * Failures are contained at the smallest scope: a bad line or node is
 * skipped, a failed project is reported on its own entry, and only a missing
 * workspace fails an operation up front.
 *
 * Usage:
 * @code
 *     auto report = parsers::parse_report_file(path);
 *     if (report.is_err()) {
 *         std::cerr << report.error() << std::endl;
 *         // Output: [ParseError] Root element is not <coverage> (context: out/coverage.xml)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace cova {

    enum class ErrorCode {
        None,                ///< No error
        InvalidArgument,     ///< Invalid argument or option value
        NotFound,            ///< Resource not found
        ParseError,          ///< Parsing failed
        IoError,             ///< I/O operation failed
        ConfigError,         ///< Configuration or workspace precondition failed
        DiscoveryError,      ///< Project metadata unreadable
        ProcessLaunchError,  ///< External process could not run to completion
        ProcessTimeout,      ///< External process exceeded the timeout
        ComparisonError,     ///< Baseline unusable for comparison
        Cancelled,           ///< Run-level cancellation requested
        InternalError        ///< Internal/unexpected error
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:               return "None";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::NotFound:           return "NotFound";
            case ErrorCode::ParseError:         return "ParseError";
            case ErrorCode::IoError:            return "IoError";
            case ErrorCode::ConfigError:        return "ConfigError";
            case ErrorCode::DiscoveryError:     return "DiscoveryError";
            case ErrorCode::ProcessLaunchError: return "ProcessLaunchError";
            case ErrorCode::ProcessTimeout:     return "ProcessTimeout";
            case ErrorCode::ComparisonError:    return "ComparisonError";
            case ErrorCode::Cancelled:          return "Cancelled";
            case ErrorCode::InternalError:      return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error type with code, message, and optional context.
     *
     * Context usually carries the path of the project, report or snapshot
     * the error refers to.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error discovery_error(std::string message, std::string context) {
            return {ErrorCode::DiscoveryError, std::move(message), std::move(context)};
        }

        static Error launch_error(std::string message, std::string context) {
            return {ErrorCode::ProcessLaunchError, std::move(message), std::move(context)};
        }

        static Error timeout(std::string message, std::string context) {
            return {ErrorCode::ProcessTimeout, std::move(message), std::move(context)};
        }

        static Error comparison_error(std::string message) {
            return {ErrorCode::ComparisonError, std::move(message)};
        }

        static Error cancelled(std::string message) {
            return {ErrorCode::Cancelled, std::move(message)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Format: "[ErrorCode] message" or "[ErrorCode] message (context: ...)"
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace cova

#endif //COVA_ERROR_HPP
