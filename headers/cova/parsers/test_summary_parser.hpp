//
// Created by gregorian-rayne on 1/11/26.
//

#ifndef COVA_TEST_SUMMARY_PARSER_HPP
#define COVA_TEST_SUMMARY_PARSER_HPP

/**
 * @file test_summary_parser.hpp
 * @brief Extracts test counts and failures from a test run transcript.
 *
 * Two summary shapes are recognized:
 *
 * @code
 *     Total tests: 18
 *          Passed: 15
 *          Failed: 2
 *         Skipped: 1
 *
 *     Test Run Successful. Total: 18, Passed: 15, Failed: 2, Skipped: 1 - 00:00:05.123
 *     Failed!  - Failed: 2, Passed: 15, Skipped: 1, Total: 18, Duration: 5 s - App.Tests.dll
 * @endcode
 *
 * Within each shape the last value seen wins. When a single-line summary
 * is present its values take precedence over the block form. Lines that
 * match neither are ignored, and unparsable numbers leave the field at 0.
 */

#include "cova/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cova::parsers {

    /**
     * Parses "HH:MM:SS.fff" (fraction optional, any precision).
     */
    [[nodiscard]] std::optional<Duration> parse_clock_duration(std::string_view text);

    /**
     * Parses "5 s", "1.2 s", "340 ms", "2 m 3 s" as printed by newer test
     * hosts after "Duration:".
     */
    [[nodiscard]] std::optional<Duration> parse_unit_duration(std::string_view text);

    /**
     * Builds a summary from transcript lines. Never fails.
     *
     * Failure details come from "Failed <name> [<time>]" headers followed
     * by "Error Message:" and "Stack Trace:" sections.
     */
    [[nodiscard]] TestExecutionSummary parse_test_results(const std::vector<std::string>& lines);

    /**
     * Adds @p part into @p total: counts and durations are summed, failures
     * appended.
     */
    void merge_test_summary(TestExecutionSummary& total, const TestExecutionSummary& part);

}  // namespace cova::parsers

#endif //COVA_TEST_SUMMARY_PARSER_HPP
