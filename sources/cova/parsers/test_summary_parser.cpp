//
// Created by gregorian-rayne on 1/11/26.
//

#include "cova/parsers/test_summary_parser.hpp"
#include "cova/utils/string_utils.hpp"

#include <redlog.hpp>

#include <regex>

namespace cova::parsers {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.parsers.tests");

        struct Counts {
            std::optional<int> total;
            std::optional<int> passed;
            std::optional<int> failed;
            std::optional<int> skipped;
            std::optional<Duration> time;
        };

        enum class Section {
            None,
            Message,
            StackTrace,
            Other
        };

        const std::regex& terminal_field_regex() {
            static const std::regex re(R"(\b(Total|Passed|Failed|Skipped):\s*([^,\s]*))");
            return re;
        }

        const std::regex& clock_regex() {
            static const std::regex re(R"((\d+:\d{1,2}:\d{1,2}(?:\.\d+)?))");
            return re;
        }

        const std::regex& unit_duration_regex() {
            static const std::regex re(R"(Duration:\s*(.+?)(?:\s+-\s+|$))");
            return re;
        }

        const std::regex& failed_header_regex() {
            static const std::regex re(R"(^\s*Failed\s+(\S.*?)\s*\[[^\]]*\]\s*$)");
            return re;
        }

        const std::regex& other_result_regex() {
            static const std::regex re(R"(^\s*(Passed|Skipped)\s+\S.*\[[^\]]*\]\s*$)");
            return re;
        }

        /**
         * Parses the value after "<Label>:" on a block-form line.
         */
        void assign_block_value(const std::string_view rest, std::optional<int>& field) {
            if (const auto value = string_utils::parse_int(rest)) {
                field = *value;
            } else {
                log_.trc("malformed count ignored", redlog::field("value", std::string(rest)));
            }
        }

        bool is_terminal_line(const std::string& line) {
            return string_utils::contains(line, "Total:") &&
                   (string_utils::contains(line, "Passed:") || string_utils::contains(line, "Failed:"));
        }

        void parse_terminal_line(const std::string& line, Counts& counts) {
            for (auto it = std::sregex_iterator(line.begin(), line.end(), terminal_field_regex());
                 it != std::sregex_iterator(); ++it) {
                const auto& match = *it;
                const auto label = match[1].str();
                const auto value = string_utils::parse_int(match[2].str());
                if (!value) {
                    log_.trc("malformed count ignored", redlog::field("field", label),
                             redlog::field("value", match[2].str()));
                    continue;
                }
                if (label == "Total") counts.total = *value;
                else if (label == "Passed") counts.passed = *value;
                else if (label == "Failed") counts.failed = *value;
                else if (label == "Skipped") counts.skipped = *value;
            }

            std::smatch match;
            if (std::regex_search(line, match, clock_regex())) {
                if (auto time = parse_clock_duration(match[1].str())) {
                    counts.time = *time;
                }
            } else if (std::regex_search(line, match, unit_duration_regex())) {
                if (auto time = parse_unit_duration(match[1].str())) {
                    counts.time = *time;
                }
            }
        }

        /**
         * @return true when the line belonged to the block form.
         */
        bool parse_block_line(const std::string_view trimmed, Counts& counts) {
            constexpr std::string_view kTotal = "Total tests:";
            constexpr std::string_view kPassed = "Passed:";
            constexpr std::string_view kFailed = "Failed:";
            constexpr std::string_view kSkipped = "Skipped:";
            constexpr std::string_view kTime = "Total time:";

            if (string_utils::starts_with(trimmed, kTotal)) {
                assign_block_value(trimmed.substr(kTotal.size()), counts.total);
            } else if (string_utils::starts_with(trimmed, kPassed)) {
                assign_block_value(trimmed.substr(kPassed.size()), counts.passed);
            } else if (string_utils::starts_with(trimmed, kFailed)) {
                assign_block_value(trimmed.substr(kFailed.size()), counts.failed);
            } else if (string_utils::starts_with(trimmed, kSkipped)) {
                assign_block_value(trimmed.substr(kSkipped.size()), counts.skipped);
            } else if (string_utils::starts_with(trimmed, kTime)) {
                if (auto time = parse_unit_duration(trimmed.substr(kTime.size()))) {
                    counts.time = *time;
                }
            } else {
                return false;
            }
            return true;
        }

        TestFailure failure_from_name(const std::string& full_name) {
            TestFailure failure;
            const auto paren = full_name.find('(');
            const auto base_end = paren == std::string::npos ? full_name.size() : paren;
            const auto dot = full_name.rfind('.', base_end == 0 ? 0 : base_end - 1);

            if (dot == std::string::npos || dot >= base_end) {
                failure.test_name = full_name;
            } else {
                failure.test_class = full_name.substr(0, dot);
                failure.test_name = full_name.substr(dot + 1);
            }
            return failure;
        }

        void append_text(std::string& target, const std::string_view text) {
            if (!target.empty()) {
                target += '\n';
            }
            target += text;
        }

    }  // namespace

    std::optional<Duration> parse_clock_duration(std::string_view text) {
        text = string_utils::trim(text);
        const auto parts = string_utils::split(text, ':');
        if (parts.size() != 3) {
            return std::nullopt;
        }

        const auto hours = string_utils::parse_int(parts[0]);
        const auto minutes = string_utils::parse_int(parts[1]);
        const auto seconds = string_utils::parse_double(parts[2]);
        if (!hours || !minutes || !seconds || *hours < 0 || *minutes < 0 || *seconds < 0.0) {
            return std::nullopt;
        }

        const double total_seconds = *hours * 3600.0 + *minutes * 60.0 + *seconds;
        // Round to whole microseconds so "05.123" is exactly 5123 ms.
        const auto micros = std::chrono::microseconds(static_cast<long long>(total_seconds * 1e6 + 0.5));
        return std::chrono::duration_cast<Duration>(micros);
    }

    std::optional<Duration> parse_unit_duration(std::string_view text) {
        static const std::regex part_regex(R"((\d+(?:\.\d+)?)\s*([A-Za-z]+))");

        const std::string input(string_utils::trim(text));
        double seconds = 0.0;
        bool any = false;

        for (auto it = std::sregex_iterator(input.begin(), input.end(), part_regex);
             it != std::sregex_iterator(); ++it) {
            const auto value = string_utils::parse_double((*it)[1].str());
            if (!value) {
                continue;
            }
            const auto unit = string_utils::to_lower((*it)[2].str());
            if (unit == "ms" || string_utils::starts_with(unit, "millisecond")) {
                seconds += *value / 1000.0;
            } else if (unit == "s" || unit == "sec" || string_utils::starts_with(unit, "second")) {
                seconds += *value;
            } else if (unit == "m" || unit == "min" || string_utils::starts_with(unit, "minute")) {
                seconds += *value * 60.0;
            } else if (unit == "h" || string_utils::starts_with(unit, "hour")) {
                seconds += *value * 3600.0;
            } else {
                continue;
            }
            any = true;
        }

        if (!any) {
            return std::nullopt;
        }
        const auto micros = std::chrono::microseconds(static_cast<long long>(seconds * 1e6 + 0.5));
        return std::chrono::duration_cast<Duration>(micros);
    }

    TestExecutionSummary parse_test_results(const std::vector<std::string>& lines) {
        Counts block;
        Counts terminal;
        bool terminal_seen = false;

        std::vector<TestFailure> failures;
        TestFailure* current = nullptr;
        Section section = Section::None;

        for (const auto& line : lines) {
            const auto trimmed = string_utils::trim(line);

            if (std::smatch match; std::regex_match(line, match, failed_header_regex())) {
                failures.push_back(failure_from_name(match[1].str()));
                current = &failures.back();
                section = Section::None;
                continue;
            }

            if (is_terminal_line(line)) {
                parse_terminal_line(line, terminal);
                terminal_seen = true;
                current = nullptr;
                continue;
            }

            if (parse_block_line(trimmed, block)) {
                current = nullptr;
                continue;
            }

            if (std::regex_match(line, other_result_regex())) {
                current = nullptr;
                continue;
            }

            if (current == nullptr) {
                continue;
            }

            if (trimmed == "Error Message:") {
                section = Section::Message;
            } else if (trimmed == "Stack Trace:") {
                section = Section::StackTrace;
            } else if (string_utils::ends_with(trimmed, "Messages:")) {
                section = Section::Other;
            } else if (!trimmed.empty()) {
                if (section == Section::Message) {
                    append_text(current->error_message, trimmed);
                } else if (section == Section::StackTrace) {
                    append_text(current->stack_trace, trimmed);
                }
            }
        }

        auto pick = [terminal_seen](const std::optional<int>& from_terminal, const std::optional<int>& from_block) {
            if (terminal_seen && from_terminal) {
                return *from_terminal;
            }
            return from_block.value_or(0);
        };

        TestExecutionSummary summary;
        summary.passed_tests = pick(terminal.passed, block.passed);
        summary.failed_tests = pick(terminal.failed, block.failed);
        summary.skipped_tests = pick(terminal.skipped, block.skipped);

        // The total is always the sum of the outcomes, whatever the runner printed.
        const int reported = pick(terminal.total, block.total);
        summary.total_tests = summary.passed_tests + summary.failed_tests + summary.skipped_tests;
        if (reported != summary.total_tests) {
            log_.dbg("reported total disagrees with outcomes", redlog::field("reported", reported),
                     redlog::field("counted", summary.total_tests));
        }

        if (terminal_seen && terminal.time) {
            summary.execution_time = *terminal.time;
        } else if (block.time) {
            summary.execution_time = *block.time;
        }

        summary.failures = std::move(failures);

        log_.dbg("parsed test summary", redlog::field("total", summary.total_tests),
                 redlog::field("passed", summary.passed_tests), redlog::field("failed", summary.failed_tests),
                 redlog::field("skipped", summary.skipped_tests),
                 redlog::field("failures", summary.failures.size()));

        return summary;
    }

    void merge_test_summary(TestExecutionSummary& total, const TestExecutionSummary& part) {
        total.total_tests += part.total_tests;
        total.passed_tests += part.passed_tests;
        total.failed_tests += part.failed_tests;
        total.skipped_tests += part.skipped_tests;
        total.execution_time += part.execution_time;
        total.failures.insert(total.failures.end(), part.failures.begin(), part.failures.end());
    }

}  // namespace cova::parsers
