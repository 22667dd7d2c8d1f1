//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef COVA_STRING_UTILS_HPP
#define COVA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting, case-insensitive matching and the tolerant number
 * parsing used by the transcript and report parsers.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>

namespace cova::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter.
     *
     * @param s The string to split.
     * @param delimiter The character to split on.
     * @return A vector of string views representing the parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Joins strings with a delimiter.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Case-insensitive equality (ASCII).
     */
    inline bool iequals(const std::string_view a, const std::string_view b) noexcept {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](const unsigned char x, const unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    /**
     * True when any element of @p list equals @p value ignoring case.
     */
    inline bool contains_ignore_case(const std::vector<std::string>& list, const std::string_view value) {
        return std::ranges::any_of(list, [value](const std::string& item) {
            return iequals(item, value);
        });
    }

    /**
     * Parses a whole string as a base-10 integer.
     *
     * Surrounding whitespace is ignored. Returns nullopt for empty input,
     * trailing garbage or values that do not fit in an int.
     */
    inline std::optional<int> parse_int(std::string_view s) noexcept {
        s = trim(s);
        if (s.empty()) {
            return std::nullopt;
        }
        int value = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Parses a whole string as a floating point number.
     */
    inline std::optional<double> parse_double(std::string_view s) noexcept {
        s = trim(s);
        if (s.empty()) {
            return std::nullopt;
        }
        double value = 0.0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Glob match supporting '*' (any run, including '/') and '?'.
     */
    inline bool glob_match(const std::string_view pattern, const std::string_view text) noexcept {
        std::size_t p = 0;
        std::size_t t = 0;
        std::size_t star = std::string_view::npos;
        std::size_t mark = 0;

        while (t < text.size()) {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
                ++p;
                ++t;
            } else if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                mark = t;
            } else if (star != std::string_view::npos) {
                p = star + 1;
                t = ++mark;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

    /**
     * Formats a duration in human-readable form.
     *
     * @param nanoseconds Duration in nanoseconds.
     * @return Human-readable string like "1.50s", "250.00ms".
     */
    inline std::string format_duration(const long long nanoseconds) {
        constexpr long long ns_per_s = 1000000000LL;
        constexpr long long ns_per_min = 60LL * ns_per_s;

        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed;

        if (nanoseconds >= ns_per_min) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_min) << "min";
        } else if (nanoseconds >= ns_per_s) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_s) << "s";
        } else if (constexpr long long ns_per_ms = 1000000LL; nanoseconds >= ns_per_ms) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_ms) << "ms";
        } else {
            oss << nanoseconds << "ns";
        }

        return oss.str();
    }

}  // namespace cova::string_utils

#endif //COVA_STRING_UTILS_HPP
