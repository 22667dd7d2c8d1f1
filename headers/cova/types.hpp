//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef COVA_TYPES_HPP
#define COVA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for coverage analysis.
 *
 * Types are organized into categories:
 *
 * - Basic Types: Duration, Timestamp
 * - Options: CoverageAnalysisOptions
 * - Test Execution: TestFailure, TestExecutionSummary
 * - Coverage Tree: CoverageSummary, LineCoverage, BranchCoverage,
 *   MethodCoverage, ClassCoverage, FileCoverage, ProjectCoverage
 * - Results: CoverageAnalysisResult, UncoveredCodeResult,
 *   CoverageComparisonResult and friends
 *
 * Every entity is created fresh per operation and owned by the result that
 * returns it.
 */

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace cova {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;

    using Timestamp = std::chrono::system_clock::time_point;

    // ============================================================================
    // Enumerations
    // ============================================================================

    enum class CoverageStatus {
        NotCoverable,
        Covered,
        Uncovered,
        PartiallyCovered
    };

    /**
     * Kind of control flow a branch point belongs to.
     *
     * Cobertura reports "jump" for conditionals and "switch" for
     * multi-way branches; the remaining kinds come from tools that
     * annotate loops, exception handlers and early returns.
     */
    enum class BranchType {
        Conditional,
        Switch,
        Loop,
        Exception,
        Return
    };

    inline const char* to_string(CoverageStatus status) noexcept {
        switch (status) {
            case CoverageStatus::NotCoverable:     return "NotCoverable";
            case CoverageStatus::Covered:          return "Covered";
            case CoverageStatus::Uncovered:        return "Uncovered";
            case CoverageStatus::PartiallyCovered: return "PartiallyCovered";
        }
        return "NotCoverable";
    }

    inline const char* to_string(BranchType type) noexcept {
        switch (type) {
            case BranchType::Conditional: return "Conditional";
            case BranchType::Switch:      return "Switch";
            case BranchType::Loop:        return "Loop";
            case BranchType::Exception:   return "Exception";
            case BranchType::Return:      return "Return";
        }
        return "Conditional";
    }

    [[nodiscard]] std::optional<CoverageStatus> coverage_status_from_string(const std::string& text);
    [[nodiscard]] std::optional<BranchType> branch_type_from_string(const std::string& text);

    // ============================================================================
    // Options
    // ============================================================================

    /**
     * Per-invocation analysis options. Never mutated by the engine.
     *
     * Project lists match by project name, case-insensitively. Excluded
     * files are matched against report file paths either as a glob
     * pattern ('*' and '?') or as a path suffix.
     */
    struct CoverageAnalysisOptions {
        std::vector<std::string> included_projects;
        std::vector<std::string> excluded_projects;
        std::vector<std::string> included_test_projects;
        std::vector<std::string> excluded_test_projects;
        std::vector<std::string> excluded_files;
        bool include_generated_code = false;
        bool collect_branch_coverage = true;
        bool collect_method_coverage = true;
        int timeout_minutes = 10;
        std::string output_format = "json";
        bool run_in_parallel = true;
        std::optional<std::string> test_filter;

        bool operator==(const CoverageAnalysisOptions&) const = default;
    };

    // ============================================================================
    // Test Execution
    // ============================================================================

    struct TestFailure {
        std::string test_name;
        std::string test_class;
        std::string error_message;
        std::string stack_trace;
    };

    /**
     * Counts reported by the test runner. total == passed + failed + skipped.
     */
    struct TestExecutionSummary {
        int total_tests = 0;
        int passed_tests = 0;
        int failed_tests = 0;
        int skipped_tests = 0;
        Duration execution_time = Duration::zero();
        std::vector<TestFailure> failures;

        [[nodiscard]] bool all_tests_passed() const noexcept {
            return failed_tests == 0;
        }
    };

    // ============================================================================
    // Coverage Tree
    // ============================================================================

    /**
     * Counts and percentages for one node of the coverage tree.
     *
     * covered <= total for each metric and uncovered == total - covered.
     * Percentages are 0 when the matching total is 0.
     */
    struct CoverageSummary {
        int total_lines = 0;
        int covered_lines = 0;
        int uncovered_lines = 0;
        double lines_covered_percentage = 0.0;

        int total_branches = 0;
        int covered_branches = 0;
        int uncovered_branches = 0;
        double branches_covered_percentage = 0.0;

        int total_methods = 0;
        int covered_methods = 0;
        int uncovered_methods = 0;
        double methods_covered_percentage = 0.0;

        int total_classes = 0;
        int covered_classes = 0;
        int uncovered_classes = 0;
        double classes_covered_percentage = 0.0;

        bool operator==(const CoverageSummary&) const = default;
    };

    struct LineCoverage {
        int line_number = 0;
        int hit_count = 0;
        CoverageStatus status = CoverageStatus::Uncovered;
        std::string source_code;

        [[nodiscard]] bool is_covered() const noexcept {
            return hit_count > 0;
        }
    };

    struct BranchCoverage {
        int line_number = 0;
        int branch_number = 0;
        int hit_count = 0;
        std::string condition;
        BranchType type = BranchType::Conditional;

        [[nodiscard]] bool is_covered() const noexcept {
            return hit_count > 0;
        }
    };

    struct MethodCoverage {
        std::string name;
        std::string class_name;
        std::string signature;
        int start_line = 0;
        int end_line = 0;
        CoverageSummary summary;
        std::vector<LineCoverage> lines;
        std::vector<BranchCoverage> branches;

        [[nodiscard]] bool is_fully_covered() const noexcept {
            return summary.lines_covered_percentage >= 100.0;
        }

        [[nodiscard]] bool is_partially_covered() const noexcept {
            return summary.lines_covered_percentage > 0.0 &&
                   summary.lines_covered_percentage < 100.0;
        }

        [[nodiscard]] bool is_uncovered() const noexcept {
            return summary.lines_covered_percentage == 0.0;
        }

        /// Identifier used to match the same method across two snapshots.
        [[nodiscard]] std::string identifier() const {
            return class_name + "::" + name + signature;
        }
    };

    struct ClassCoverage {
        std::string name;
        std::string namespace_name;
        std::string file_path;
        CoverageSummary summary;
        std::vector<MethodCoverage> methods;
        std::vector<LineCoverage> lines;
        std::vector<BranchCoverage> branches;
    };

    struct FileCoverage {
        std::string file_path;
        std::string file_name;
        CoverageSummary summary;
        std::vector<LineCoverage> lines;
        std::vector<MethodCoverage> methods;
    };

    struct ProjectCoverage {
        std::string name;
        std::string path;
        CoverageSummary summary;
        std::vector<FileCoverage> files;
        std::vector<ClassCoverage> classes;
    };

    // ============================================================================
    // Results
    // ============================================================================

    /**
     * Outcome of a full run over every selected test project.
     *
     * Partial failures keep the succeeding projects' coverage in projects;
     * failed runs are listed in project_runs with their messages.
     */
    struct ProjectRunOutcome {
        std::string project_name;
        std::string project_path;
        bool success = false;
        std::string error_message;
        bool timed_out = false;
        Duration duration = Duration::zero();
        std::optional<std::string> coverage_file;
    };

    struct CoverageAnalysisResult {
        bool success = false;
        std::optional<std::string> error_message;
        Timestamp analysis_time{};
        Duration execution_duration = Duration::zero();
        CoverageSummary summary;
        std::vector<ProjectCoverage> projects;
        TestExecutionSummary test_results;
        std::vector<ProjectRunOutcome> project_runs;
    };

    struct UncoveredMethod {
        std::string method_name;
        std::string class_name;
        std::string file_path;
        int start_line = 0;
        int end_line = 0;
        std::string signature;
        int line_count = 0;
        std::string reason;
    };

    struct UncoveredLine {
        std::string file_path;
        int line_number = 0;
        std::string source_code;
        std::string method_name;
        std::string class_name;
    };

    struct UncoveredBranch {
        std::string file_path;
        int line_number = 0;
        int branch_number = 0;
        std::string condition;
        BranchType type = BranchType::Conditional;
        std::string method_name;
        std::string class_name;
    };

    struct UncoveredCodeResult {
        bool success = false;
        std::optional<std::string> error_message;
        std::vector<UncoveredMethod> uncovered_methods;
        std::vector<UncoveredLine> uncovered_lines;
        std::vector<UncoveredBranch> uncovered_branches;

        [[nodiscard]] std::size_t total_uncovered_items() const noexcept {
            return uncovered_methods.size() + uncovered_lines.size() + uncovered_branches.size();
        }
    };

    struct CoverageSummaryResult {
        bool success = false;
        std::optional<std::string> error_message;
        CoverageSummary summary;
    };

    struct MethodCoverageResult {
        bool success = false;
        std::optional<std::string> error_message;
        std::optional<MethodCoverage> method;
    };

    enum class DeltaTrend {
        Improved,
        Regressed,
        Unchanged
    };

    inline const char* to_string(DeltaTrend trend) noexcept {
        switch (trend) {
            case DeltaTrend::Improved:  return "Improved";
            case DeltaTrend::Regressed: return "Regressed";
            case DeltaTrend::Unchanged: return "Unchanged";
        }
        return "Unchanged";
    }

    /**
     * current - baseline, per metric. Percentage deltas are in
     * percentage points, count deltas are covered-count differences.
     */
    struct CoverageDelta {
        double lines_coverage_change = 0.0;
        double branches_coverage_change = 0.0;
        double methods_coverage_change = 0.0;
        double classes_coverage_change = 0.0;

        int lines_change = 0;
        int branches_change = 0;
        int methods_change = 0;
        int classes_change = 0;

        /// Deltas smaller than this in magnitude count as unchanged.
        static constexpr double kUnchangedTolerance = 0.01;

        [[nodiscard]] DeltaTrend trend() const noexcept {
            if (lines_coverage_change > -kUnchangedTolerance &&
                lines_coverage_change < kUnchangedTolerance) {
                return DeltaTrend::Unchanged;
            }
            return lines_coverage_change > 0.0 ? DeltaTrend::Improved : DeltaTrend::Regressed;
        }

        [[nodiscard]] bool is_improvement() const noexcept { return trend() == DeltaTrend::Improved; }
        [[nodiscard]] bool is_regression() const noexcept { return trend() == DeltaTrend::Regressed; }
        [[nodiscard]] bool is_unchanged() const noexcept { return trend() == DeltaTrend::Unchanged; }
    };

    struct FileCoverageChange {
        std::string file_path;
        double baseline_percentage = 0.0;
        double current_percentage = 0.0;

        [[nodiscard]] double change() const noexcept {
            return current_percentage - baseline_percentage;
        }
    };

    struct CoverageComparisonResult {
        bool success = false;
        std::optional<std::string> error_message;
        CoverageSummary baseline;
        CoverageSummary current;
        CoverageDelta delta;
        std::vector<FileCoverageChange> improved_files;
        std::vector<FileCoverageChange> regressed_files;
        std::vector<std::string> added_files;
        std::vector<std::string> removed_files;
        std::vector<std::string> newly_uncovered_methods;
        std::vector<std::string> newly_covered_methods;
    };

}  // namespace cova

#endif //COVA_TYPES_HPP
