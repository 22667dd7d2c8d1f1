//
// Created by gregorian-rayne on 1/2/26.
//

#ifndef COVA_FORMATTER_HPP
#define COVA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Durations and percentages
 * - Colors and styles
 * - Coverage summaries
 */

#include "cova/types.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace cova::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * Percentages at which coverage turns yellow and green.
     */
    struct CoverageThresholds {
        double good = 80.0;
        double acceptable = 50.0;
    };

    void set_coverage_thresholds(CoverageThresholds thresholds);
    [[nodiscard]] CoverageThresholds coverage_thresholds();

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
        std::optional<std::string> color;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        /**
         * Adds a separator after the last row.
         */
        void add_separator();

        [[nodiscard]] std::string render() const;

        void render(std::ostream& out) const;

        void set_show_headers(bool show) { show_headers_ = show; }

        [[nodiscard]] bool empty() const { return rows_.empty(); }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
        bool show_headers_ = true;
    };

    [[nodiscard]] std::string format_duration(Duration d);

    /**
     * Formats a percentage value (85.5 -> "85.50%").
     */
    [[nodiscard]] std::string format_percent(double pct);

    /**
     * Formats a signed percentage-point change ("+1.25 pp").
     */
    [[nodiscard]] std::string format_change(double points);

    [[nodiscard]] std::string format_path(const fs::path& path, std::size_t max_width = 60);

    [[nodiscard]] std::string format_timestamp(Timestamp ts);

    /**
     * Colors a coverage percentage by the current thresholds.
     */
    [[nodiscard]] std::string colorize_coverage(double pct);

    [[nodiscard]] std::string colorize_trend(DeltaTrend trend);

    [[nodiscard]] std::string bold(std::string_view text);

    /**
     * Bar of @p width cells filled in proportion to value / max_value,
     * colored by the coverage thresholds.
     */
    [[nodiscard]] std::string bar_graph(double value, double max_value, std::size_t width = 20);

    /**
     * Human-readable reports for service results.
     */
    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        void print_summary(const CoverageSummary& summary, std::string_view title = "Coverage Summary") const;

        void print_projects(const std::vector<ProjectCoverage>& projects) const;

        void print_runs(const std::vector<ProjectRunOutcome>& runs) const;

        void print_tests(const TestExecutionSummary& tests, std::size_t failure_limit = 10) const;

        void print_uncovered(const UncoveredCodeResult& result, std::size_t limit = 0) const;

        void print_method(const MethodCoverage& method) const;

        void print_comparison(const CoverageComparisonResult& result, std::size_t limit = 20) const;

    private:
        std::ostream& out_;
    };

}  // namespace cova::cli

#endif //COVA_FORMATTER_HPP
