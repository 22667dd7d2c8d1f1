//
// Created by gregorian-rayne on 1/13/26.
//

#include "cova/analysis/comparison.hpp"
#include "cova/analysis/aggregator.hpp"
#include "cova/parsers/cobertura_parser.hpp"
#include "support/coverage_fixtures.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace cova;
using namespace cova::analysis;

namespace {

    CoverageAnalysisResult analysed(const bool reset_covered, const parsers::ReportParseOptions& options = {}) {
        auto projects = parsers::parse_report(cova::testing::calculator_report(reset_covered), "report.xml", options);
        if (projects.is_err()) {
            throw std::runtime_error(projects.error().to_string());
        }
        CoverageAnalysisResult result;
        result.success = true;
        result.projects = std::move(projects).value();
        calculate_overall_summary(result);
        return result;
    }

    CoverageAnalysisResult single_file(const std::string& path, const int total, const int covered) {
        FileCoverage file;
        file.file_path = path;
        file.summary.total_lines = total;
        file.summary.covered_lines = covered;
        finalize_summary(file.summary);

        ProjectCoverage project;
        project.name = "Shop";
        project.files.push_back(file);
        project.summary = file.summary;

        CoverageAnalysisResult result;
        result.success = true;
        result.projects.push_back(project);
        calculate_overall_summary(result);
        return result;
    }

}  // namespace

TEST(ComparisonTest, ImprovementAcrossMetrics) {
    const auto baseline = analysed(false);
    const auto current = analysed(true);

    const auto comparison = compare_results(baseline, current);
    ASSERT_TRUE(comparison.success);

    EXPECT_DOUBLE_EQ(comparison.baseline.lines_covered_percentage, 57.14);
    EXPECT_DOUBLE_EQ(comparison.current.lines_covered_percentage, 85.71);
    EXPECT_DOUBLE_EQ(comparison.delta.lines_coverage_change, 28.57);
    EXPECT_DOUBLE_EQ(comparison.delta.methods_coverage_change, 25.0);
    EXPECT_DOUBLE_EQ(comparison.delta.branches_coverage_change, 0.0);
    EXPECT_EQ(comparison.delta.lines_change, 2);
    EXPECT_EQ(comparison.delta.methods_change, 1);
    EXPECT_EQ(comparison.delta.trend(), DeltaTrend::Improved);

    ASSERT_EQ(comparison.improved_files.size(), 1u);
    EXPECT_EQ(comparison.improved_files[0].file_path, "src/Calculator/Calculator.cs");
    EXPECT_DOUBLE_EQ(comparison.improved_files[0].baseline_percentage, 50.0);
    EXPECT_DOUBLE_EQ(comparison.improved_files[0].current_percentage, 83.33);
    EXPECT_TRUE(comparison.regressed_files.empty());

    ASSERT_EQ(comparison.newly_covered_methods.size(), 1u);
    EXPECT_EQ(comparison.newly_covered_methods[0], "Calc.Core.Calculator::Reset()");
    EXPECT_TRUE(comparison.newly_uncovered_methods.empty());
}

TEST(ComparisonTest, RegressionIsMirrorImage) {
    const auto comparison = compare_results(analysed(true), analysed(false));

    EXPECT_DOUBLE_EQ(comparison.delta.lines_coverage_change, -28.57);
    EXPECT_TRUE(comparison.delta.is_regression());
    ASSERT_EQ(comparison.regressed_files.size(), 1u);
    EXPECT_TRUE(comparison.improved_files.empty());
    ASSERT_EQ(comparison.newly_uncovered_methods.size(), 1u);
    EXPECT_EQ(comparison.newly_uncovered_methods[0], "Calc.Core.Calculator::Reset()");
}

TEST(ComparisonTest, IdenticalSnapshotsAreUnchanged) {
    const auto snapshot = analysed(false);
    const auto comparison = compare_results(snapshot, snapshot);

    EXPECT_TRUE(comparison.delta.is_unchanged());
    EXPECT_EQ(comparison.delta.lines_change, 0);
    EXPECT_TRUE(comparison.improved_files.empty());
    EXPECT_TRUE(comparison.regressed_files.empty());
    EXPECT_TRUE(comparison.added_files.empty());
    EXPECT_TRUE(comparison.removed_files.empty());
    EXPECT_TRUE(comparison.newly_covered_methods.empty());
    EXPECT_TRUE(comparison.newly_uncovered_methods.empty());
}

TEST(ComparisonTest, OneSidedFilesAreListed) {
    parsers::ReportParseOptions without_formatter;
    without_formatter.excluded_files = {"Formatter.cs"};

    const auto comparison = compare_results(analysed(false), analysed(false, without_formatter));
    ASSERT_EQ(comparison.removed_files.size(), 1u);
    EXPECT_EQ(comparison.removed_files[0], "src/Calculator/Formatter.cs");
    EXPECT_TRUE(comparison.added_files.empty());

    const auto reverse = compare_results(analysed(false, without_formatter), analysed(false));
    ASSERT_EQ(reverse.added_files.size(), 1u);
    EXPECT_EQ(reverse.added_files[0], "src/Calculator/Formatter.cs");
}

TEST(ComparisonTest, SmallFileChangesAreIgnored) {
    // 1000/2000 -> 1001/2000 is a 0.05 point change.
    const auto comparison = compare_results(single_file("Cart.cs", 2000, 1000), single_file("Cart.cs", 2000, 1001));
    EXPECT_TRUE(comparison.improved_files.empty());
    EXPECT_DOUBLE_EQ(comparison.delta.lines_coverage_change, 0.05);
    EXPECT_EQ(comparison.delta.trend(), DeltaTrend::Improved);

    const auto strict = compare_results(single_file("Cart.cs", 2000, 1000), single_file("Cart.cs", 2000, 1001), 0.0);
    EXPECT_EQ(strict.improved_files.size(), 1u);
}

TEST(ComparisonTest, FilesSortedByMagnitude) {
    auto baseline = single_file("a.cs", 10, 5);
    auto current = single_file("a.cs", 10, 6);

    FileCoverage big;
    big.file_path = "b.cs";
    big.summary.total_lines = 10;
    baseline.projects[0].files.push_back(big);
    big.summary.covered_lines = 9;
    current.projects[0].files.push_back(big);

    const auto comparison = compare_results(baseline, current);
    ASSERT_EQ(comparison.improved_files.size(), 2u);
    EXPECT_EQ(comparison.improved_files[0].file_path, "b.cs");
    EXPECT_EQ(comparison.improved_files[1].file_path, "a.cs");
}

TEST(ComparisonTest, DeltaTrendTolerance) {
    CoverageDelta delta;
    delta.lines_coverage_change = 0.009;
    EXPECT_TRUE(delta.is_unchanged());
    delta.lines_coverage_change = -0.009;
    EXPECT_TRUE(delta.is_unchanged());
    delta.lines_coverage_change = 0.01;
    EXPECT_TRUE(delta.is_improvement());
    delta.lines_coverage_change = -0.5;
    EXPECT_TRUE(delta.is_regression());
    EXPECT_STREQ(to_string(delta.trend()), "Regressed");
}

TEST(ComparisonTest, ValidateBaseline) {
    EXPECT_TRUE(validate_baseline(analysed(false)).is_ok());

    CoverageAnalysisResult failed;
    failed.error_message = "Test project build failed";
    auto rejected = validate_baseline(failed);
    ASSERT_TRUE(rejected.is_err());
    EXPECT_EQ(rejected.error().code(), ErrorCode::ComparisonError);
    EXPECT_EQ(rejected.error().message(), "Baseline analysis was not successful: Test project build failed");

    CoverageAnalysisResult silent;
    EXPECT_EQ(validate_baseline(silent).error().message(),
              "Baseline analysis was not successful: no details recorded");

    auto inconsistent = analysed(false);
    inconsistent.summary.covered_lines = inconsistent.summary.total_lines + 1;
    EXPECT_TRUE(validate_baseline(inconsistent).is_err());

    auto bad_project = analysed(false);
    bad_project.projects[0].summary.total_branches = -1;
    EXPECT_NE(validate_baseline(bad_project).error().message().find("Calculator"), std::string::npos);
}
