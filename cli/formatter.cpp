//
// Created by gregorian-rayne on 1/2/26.
//

#include "cova/cli/formatter.hpp"
#include "cova/cli/progress.hpp"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <ctime>

namespace cova::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    namespace {

        CoverageThresholds g_thresholds;

        const char* coverage_color(const double pct) {
            if (pct >= g_thresholds.good) return colors::GREEN;
            if (pct >= g_thresholds.acceptable) return colors::YELLOW;
            return colors::RED;
        }

    }  // namespace

    void set_coverage_thresholds(const CoverageThresholds thresholds) {
        g_thresholds = thresholds;
    }

    CoverageThresholds coverage_thresholds() {
        return g_thresholds;
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_duration(const Duration d) {
        auto ns = d.count();
        if (ns < 0) ns = 0;

        const auto ms = ns / 1000000;
        const auto seconds = ms / 1000;
        const auto minutes = seconds / 60;
        const auto hours = minutes / 60;

        std::ostringstream ss;

        if (hours > 0) {
            ss << hours << "h " << (minutes % 60) << "m " << (seconds % 60) << "s";
        } else if (minutes > 0) {
            ss << minutes << "m " << (seconds % 60) << "s";
        } else if (seconds > 0) {
            ss << seconds << "." << std::setfill('0') << std::setw(2) << ((ms % 1000) / 10) << "s";
        } else {
            ss << ms << "ms";
        }

        return ss.str();
    }

    std::string format_percent(const double pct) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << pct << "%";
        return ss.str();
    }

    std::string format_change(const double points) {
        std::ostringstream ss;
        ss << std::showpos << std::fixed << std::setprecision(2) << points << " pp";
        return ss.str();
    }

    std::string format_path(const fs::path& path, const std::size_t max_width) {
        std::string str = path.string();
        if (str.length() <= max_width) {
            return str;
        }

        // Keep the file name end visible
        const std::string ellipsis = "...";
        return ellipsis + str.substr(str.length() - max_width + ellipsis.length());
    }

    std::string format_timestamp(const Timestamp ts) {
        auto time_t = std::chrono::system_clock::to_time_t(ts);
        std::tm tm{};
        localtime_r(&time_t, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string colorize_coverage(const double pct) {
        std::string formatted = format_percent(pct);
        if (!colors::enabled()) {
            return formatted;
        }

        return std::string(coverage_color(pct)) + formatted + colors::RESET;
    }

    std::string colorize_trend(const DeltaTrend trend) {
        std::string name = to_string(trend);
        if (!colors::enabled()) {
            return name;
        }

        switch (trend) {
        case DeltaTrend::Improved:
            return std::string(colors::GREEN) + name + colors::RESET;
        case DeltaTrend::Regressed:
            return std::string(colors::RED) + colors::BOLD + name + colors::RESET;
        case DeltaTrend::Unchanged:
            break;
        }
        return std::string(colors::DIM) + name + colors::RESET;
    }

    std::string bold(const std::string_view text) {
        if (!colors::enabled()) {
            return std::string(text);
        }
        return std::string(colors::BOLD) + std::string(text) + colors::RESET;
    }

    std::string bar_graph(const double value, double max_value, const std::size_t width) {
        if (max_value <= 0) max_value = 1.0;
        const double pct = std::clamp(value / max_value, 0.0, 1.0);
        const std::size_t filled = static_cast<std::size_t>(pct * static_cast<double>(width));

        std::string result;

        if (colors::enabled()) {
            result += coverage_color(pct * 100.0);
            for (std::size_t i = 0; i < filled; ++i) {
                result += "█";
            }
            result += colors::RESET;
            result += colors::DIM;
            for (std::size_t i = filled; i < width; ++i) {
                result += "░";
            }
            result += colors::RESET;
        } else {
            for (std::size_t i = 0; i < filled; ++i) {
                result += "#";
            }
            for (std::size_t i = filled; i < width; ++i) {
                result += "-";
            }
        }

        return result;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        // Pad row to match column count
        while (row.size() < columns_.size()) {
            row.push_back("");
        }
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                // Auto-calculate
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        // Make a mutable copy to calculate widths
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                // Truncate if too long
                if (cell.length() > col.width) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";  // Column separator
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i < temp.columns_.size() - 1) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (std::size_t i = 0; i < temp.rows_.size(); ++i) {
            render_row(temp.rows_[i]);
            if (i < temp.separators_.size() && temp.separators_[i]) {
                render_separator();
            }
        }
    }

    // ============================================================================
    // SummaryPrinter Implementation
    // ============================================================================

    namespace {

        void print_heading(std::ostream& out, const std::string_view title, const char underline) {
            out << bold(title) << "\n";
            out << std::string(60, underline) << "\n\n";
        }

        std::string ratio(const int covered, const int total) {
            return std::to_string(covered) + "/" + std::to_string(total);
        }

    }  // namespace

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_summary(const CoverageSummary& summary, const std::string_view title) const
    {
        out_ << "\n";
        print_heading(out_, title, '=');

        auto metric = [&](const std::string_view label, const int covered, const int total, const double pct) {
            out_ << std::left << std::setw(10) << label
                 << bar_graph(pct, 100.0) << "  "
                 << std::right << std::setw(8) << colorize_coverage(pct)
                 << "  (" << ratio(covered, total) << ")\n";
        };

        metric("Lines", summary.covered_lines, summary.total_lines, summary.lines_covered_percentage);
        metric("Branches", summary.covered_branches, summary.total_branches, summary.branches_covered_percentage);
        metric("Methods", summary.covered_methods, summary.total_methods, summary.methods_covered_percentage);
        metric("Classes", summary.covered_classes, summary.total_classes, summary.classes_covered_percentage);
        out_ << "\n";
    }

    void SummaryPrinter::print_projects(const std::vector<ProjectCoverage>& projects) const
    {
        if (projects.empty()) return;

        print_heading(out_, "Projects", '-');

        Table table({
            {"Project", 0, false, std::nullopt},
            {"Lines", 0, true, std::nullopt},
            {"Line %", 0, true, std::nullopt},
            {"Branch %", 0, true, std::nullopt},
            {"Method %", 0, true, std::nullopt},
            {"Files", 0, true, std::nullopt}
        });

        for (const auto& project : projects) {
            const auto& s = project.summary;
            table.add_row({
                project.name,
                ratio(s.covered_lines, s.total_lines),
                format_percent(s.lines_covered_percentage),
                format_percent(s.branches_covered_percentage),
                format_percent(s.methods_covered_percentage),
                std::to_string(project.files.size())
            });
        }

        table.render(out_);
        out_ << "\n";
    }

    void SummaryPrinter::print_runs(const std::vector<ProjectRunOutcome>& runs) const
    {
        if (runs.empty()) return;

        print_heading(out_, "Test Projects", '-');

        Table table({
            {"Test Project", 0, false, std::nullopt},
            {"Status", 0, false, std::nullopt},
            {"Duration", 0, true, std::nullopt},
            {"Message", 0, false, std::nullopt}
        });

        for (const auto& run : runs) {
            std::string status = run.success ? "ok" : (run.timed_out ? "timeout" : "failed");
            table.add_row({run.project_name, status, format_duration(run.duration), run.error_message});
        }

        table.render(out_);
        out_ << "\n";
    }

    void SummaryPrinter::print_tests(const TestExecutionSummary& tests, const std::size_t failure_limit) const
    {
        print_heading(out_, "Tests", '-');

        out_ << "Total:    " << tests.total_tests << "\n";
        out_ << "Passed:   " << tests.passed_tests << "\n";
        out_ << "Failed:   " << tests.failed_tests << "\n";
        out_ << "Skipped:  " << tests.skipped_tests << "\n";
        out_ << "Duration: " << format_duration(tests.execution_time) << "\n";

        if (!tests.failures.empty()) {
            out_ << "\n";
            std::size_t shown = 0;
            for (const auto& failure : tests.failures) {
                if (failure_limit > 0 && shown >= failure_limit) {
                    out_ << "  ... and " << (tests.failures.size() - shown) << " more\n";
                    break;
                }
                if (colors::enabled()) {
                    out_ << "  " << colors::RED << "FAIL" << colors::RESET << " ";
                } else {
                    out_ << "  FAIL ";
                }
                out_ << failure.test_name;
                if (!failure.error_message.empty()) {
                    out_ << ": " << failure.error_message;
                }
                out_ << "\n";
                ++shown;
            }
        }
        out_ << "\n";
    }

    void SummaryPrinter::print_uncovered(const UncoveredCodeResult& result, const std::size_t limit) const
    {
        out_ << "\n";
        print_heading(out_, "Uncovered Code", '=');

        out_ << result.uncovered_methods.size() << " methods, "
             << result.uncovered_lines.size() << " lines, "
             << result.uncovered_branches.size() << " branch outcomes\n\n";

        if (!result.uncovered_methods.empty()) {
            Table table({
                {"Method", 0, false, std::nullopt},
                {"File", 0, false, std::nullopt},
                {"Lines", 0, true, std::nullopt},
                {"Reason", 0, false, std::nullopt}
            });
            std::size_t shown = 0;
            for (const auto& method : result.uncovered_methods) {
                if (limit > 0 && shown++ >= limit) break;
                table.add_row({
                    method.class_name + "." + method.method_name,
                    format_path(method.file_path, 50) + ":" + std::to_string(method.start_line),
                    std::to_string(method.line_count),
                    method.reason
                });
            }
            table.render(out_);
            out_ << "\n";
        }

        if (!result.uncovered_lines.empty()) {
            Table table({
                {"Location", 0, false, std::nullopt},
                {"Method", 0, false, std::nullopt},
                {"Source", 60, false, std::nullopt}
            });
            std::size_t shown = 0;
            for (const auto& line : result.uncovered_lines) {
                if (limit > 0 && shown++ >= limit) break;
                table.add_row({
                    format_path(line.file_path, 50) + ":" + std::to_string(line.line_number),
                    line.method_name,
                    line.source_code
                });
            }
            table.render(out_);
            out_ << "\n";
        }

        if (!result.uncovered_branches.empty()) {
            Table table({
                {"Location", 0, false, std::nullopt},
                {"Branch", 0, true, std::nullopt},
                {"Type", 0, false, std::nullopt},
                {"Condition", 0, false, std::nullopt}
            });
            std::size_t shown = 0;
            for (const auto& branch : result.uncovered_branches) {
                if (limit > 0 && shown++ >= limit) break;
                table.add_row({
                    format_path(branch.file_path, 50) + ":" + std::to_string(branch.line_number),
                    std::to_string(branch.branch_number),
                    to_string(branch.type),
                    branch.condition
                });
            }
            table.render(out_);
            out_ << "\n";
        }
    }

    void SummaryPrinter::print_method(const MethodCoverage& method) const
    {
        out_ << "\n";
        print_heading(out_, method.class_name + "." + method.name + method.signature, '=');

        out_ << "Lines " << method.start_line << "-" << method.end_line << "\n\n";
        print_summary(method.summary, "Method Coverage");

        if (method.lines.empty()) return;

        Table table({
            {"Line", 0, true, std::nullopt},
            {"Hits", 0, true, std::nullopt},
            {"Status", 0, false, std::nullopt}
        });
        for (const auto& line : method.lines) {
            table.add_row({std::to_string(line.line_number), std::to_string(line.hit_count), to_string(line.status)});
        }
        table.render(out_);
        out_ << "\n";
    }

    void SummaryPrinter::print_comparison(const CoverageComparisonResult& result, const std::size_t limit) const
    {
        out_ << "\n";
        print_heading(out_, "Coverage Comparison", '=');

        Table table({
            {"Metric", 0, false, std::nullopt},
            {"Baseline", 0, true, std::nullopt},
            {"Current", 0, true, std::nullopt},
            {"Change", 0, true, std::nullopt}
        });
        table.add_row({"Lines", format_percent(result.baseline.lines_covered_percentage),
                       format_percent(result.current.lines_covered_percentage),
                       format_change(result.delta.lines_coverage_change)});
        table.add_row({"Branches", format_percent(result.baseline.branches_covered_percentage),
                       format_percent(result.current.branches_covered_percentage),
                       format_change(result.delta.branches_coverage_change)});
        table.add_row({"Methods", format_percent(result.baseline.methods_covered_percentage),
                       format_percent(result.current.methods_covered_percentage),
                       format_change(result.delta.methods_coverage_change)});
        table.add_row({"Classes", format_percent(result.baseline.classes_covered_percentage),
                       format_percent(result.current.classes_covered_percentage),
                       format_change(result.delta.classes_coverage_change)});
        table.render(out_);

        out_ << "\nTrend: " << colorize_trend(result.delta.trend()) << "\n\n";

        auto print_files = [&](const std::string_view title, const std::vector<FileCoverageChange>& files) {
            if (files.empty()) return;
            out_ << bold(title) << "\n";
            std::size_t shown = 0;
            for (const auto& file : files) {
                if (limit > 0 && shown++ >= limit) break;
                out_ << "  " << format_path(file.file_path, 60) << "  "
                     << format_percent(file.baseline_percentage) << " -> "
                     << format_percent(file.current_percentage)
                     << " (" << format_change(file.change()) << ")\n";
            }
            out_ << "\n";
        };

        auto print_names = [&](const std::string_view title, const std::vector<std::string>& names) {
            if (names.empty()) return;
            out_ << bold(title) << "\n";
            std::size_t shown = 0;
            for (const auto& name : names) {
                if (limit > 0 && shown++ >= limit) {
                    out_ << "  ... and " << (names.size() - limit) << " more\n";
                    break;
                }
                out_ << "  " << name << "\n";
            }
            out_ << "\n";
        };

        print_files("Improved files", result.improved_files);
        print_files("Regressed files", result.regressed_files);
        print_names("Added files", result.added_files);
        print_names("Removed files", result.removed_files);
        print_names("Newly uncovered methods", result.newly_uncovered_methods);
        print_names("Newly covered methods", result.newly_covered_methods);
    }

}  // namespace cova::cli
