//
// Created by gregorian-rayne on 1/13/26.
//

#include "cova/analysis/aggregator.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace cova;
using namespace cova::analysis;

namespace {

    LineCoverage line(const int number, const int hits) {
        LineCoverage l;
        l.line_number = number;
        l.hit_count = hits;
        l.status = hits > 0 ? CoverageStatus::Covered : CoverageStatus::Uncovered;
        return l;
    }

    ClassCoverage make_class(const std::string& name, const std::string& file, std::vector<LineCoverage> lines,
                             const double rate) {
        ClassCoverage cls;
        cls.name = name;
        cls.file_path = file;
        cls.lines = std::move(lines);
        cls.summary.total_lines = static_cast<int>(cls.lines.size());
        cls.summary.lines_covered_percentage = rate;
        cls.summary.total_classes = 1;
        cls.summary.covered_classes = rate > 0.0 ? 1 : 0;
        return cls;
    }

    ProjectCoverage project_with_counts(const std::string& name, const int total, const int covered) {
        ProjectCoverage p;
        p.name = name;
        p.summary.total_lines = total;
        p.summary.covered_lines = covered;
        finalize_summary(p.summary);
        return p;
    }

}  // namespace

TEST(AggregatorTest, Percentage) {
    EXPECT_DOUBLE_EQ(percentage(1, 3), 33.33);
    EXPECT_DOUBLE_EQ(percentage(2, 3), 66.67);
    EXPECT_DOUBLE_EQ(percentage(5, 5), 100.0);
    EXPECT_DOUBLE_EQ(percentage(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(percentage(3, -1), 0.0);
    EXPECT_DOUBLE_EQ(round_percentage(12.346), 12.35);
    EXPECT_DOUBLE_EQ(round_percentage(std::numeric_limits<double>::quiet_NaN()), 0.0);
}

TEST(AggregatorTest, FinalizeDerivesUncoveredCounts) {
    CoverageSummary summary;
    summary.total_branches = 4;
    summary.covered_branches = 1;
    summary.total_classes = 2;
    summary.covered_classes = 2;
    finalize_summary(summary);

    EXPECT_EQ(summary.uncovered_branches, 3);
    EXPECT_DOUBLE_EQ(summary.branches_covered_percentage, 25.0);
    EXPECT_DOUBLE_EQ(summary.classes_covered_percentage, 100.0);
    EXPECT_DOUBLE_EQ(summary.lines_covered_percentage, 0.0);
}

TEST(AggregatorTest, OverallSummaryUsesCountsNotAverages) {
    CoverageAnalysisResult result;
    result.projects.push_back(project_with_counts("Api", 100, 80));
    result.projects.push_back(project_with_counts("Core", 200, 120));

    calculate_overall_summary(result);

    EXPECT_EQ(result.summary.total_lines, 300);
    EXPECT_EQ(result.summary.covered_lines, 200);
    EXPECT_EQ(result.summary.uncovered_lines, 100);
    EXPECT_DOUBLE_EQ(result.summary.lines_covered_percentage, 66.67);
}

TEST(AggregatorTest, OverallSummaryIsIdempotent) {
    CoverageAnalysisResult result;
    result.projects.push_back(project_with_counts("Api", 7, 4));

    calculate_overall_summary(result);
    const auto first = result.summary;
    calculate_overall_summary(result);

    EXPECT_EQ(result.summary, first);
    EXPECT_EQ(result.projects.size(), 1u);
}

TEST(AggregatorTest, EmptyResultHasZeroSummary) {
    CoverageAnalysisResult result;
    calculate_overall_summary(result);
    EXPECT_EQ(result.summary, CoverageSummary{});
}

TEST(AggregatorTest, FilesMergeClassesSharingAPath) {
    const std::vector<ClassCoverage> classes = {
        make_class("Shop.Cart", "src/Cart.cs", {line(1, 2), line(2, 0)}, 50.0),
        make_class("Shop.Cart/Inner", "src\\Cart.cs", {line(2, 5), line(3, 0)}, 50.0),
        make_class("Shop.Order", "src/./Order.cs", {line(1, 0)}, 0.0),
    };

    const auto files = build_file_coverage(classes);
    ASSERT_EQ(files.size(), 2u);

    const auto& cart = files[0];
    EXPECT_EQ(cart.file_path, "src/Cart.cs");
    EXPECT_EQ(cart.file_name, "Cart.cs");
    ASSERT_EQ(cart.lines.size(), 3u);
    EXPECT_EQ(cart.lines[1].hit_count, 5);
    EXPECT_EQ(cart.lines[1].status, CoverageStatus::Covered);
    EXPECT_EQ(cart.summary.covered_lines, 2);
    EXPECT_EQ(cart.summary.total_classes, 2);

    const auto& order = files[1];
    EXPECT_EQ(order.file_path, "src/Order.cs");
    EXPECT_EQ(order.summary.covered_classes, 0);
    EXPECT_DOUBLE_EQ(order.summary.classes_covered_percentage, 0.0);
}

TEST(AggregatorTest, SummarizeProjectSumsFiles) {
    ProjectCoverage project;
    project.name = "Shop";
    project.classes = {
        make_class("Shop.Cart", "src/Cart.cs", {line(1, 2), line(2, 0)}, 50.0),
        make_class("Shop.Order", "src/Order.cs", {line(1, 1)}, 100.0),
    };

    summarize_project(project);

    EXPECT_EQ(project.files.size(), 2u);
    EXPECT_EQ(project.summary.total_lines, 3);
    EXPECT_EQ(project.summary.covered_lines, 2);
    EXPECT_DOUBLE_EQ(project.summary.lines_covered_percentage, 66.67);
    EXPECT_EQ(project.summary.covered_classes, 2);
}

TEST(AggregatorTest, MergeProjectsCombinesHits) {
    ProjectCoverage first;
    first.name = "Shop";
    first.classes = {make_class("Shop.Cart", "src/Cart.cs", {line(1, 2), line(2, 0)}, 50.0)};
    summarize_project(first);

    ProjectCoverage second;
    second.name = "Shop";
    second.classes = {
        make_class("Shop.Cart", "src/Cart.cs", {line(1, 1), line(2, 3)}, 100.0),
        make_class("Shop.Order", "src/Order.cs", {line(7, 0)}, 0.0),
    };
    summarize_project(second);

    ProjectCoverage other;
    other.name = "Billing";

    const auto merged = merge_projects({first, second, other});
    ASSERT_EQ(merged.size(), 2u);

    const auto& shop = merged[0];
    EXPECT_EQ(shop.name, "Shop");
    ASSERT_EQ(shop.classes.size(), 2u);

    const auto& cart = shop.classes[0];
    ASSERT_EQ(cart.lines.size(), 2u);
    EXPECT_EQ(cart.lines[0].hit_count, 3);
    EXPECT_EQ(cart.lines[1].hit_count, 3);
    EXPECT_DOUBLE_EQ(cart.summary.lines_covered_percentage, 100.0);

    EXPECT_EQ(shop.summary.total_lines, 3);
    EXPECT_EQ(shop.summary.covered_lines, 2);
    EXPECT_EQ(merged[1].name, "Billing");
}

TEST(AggregatorTest, MergedHitsSaturate) {
    ProjectCoverage first;
    first.name = "Shop";
    first.classes = {make_class("Shop.Cart", "Cart.cs", {line(1, std::numeric_limits<int>::max())}, 100.0)};

    ProjectCoverage second = first;

    const auto merged = merge_projects({first, second});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].classes[0].lines[0].hit_count, std::numeric_limits<int>::max());
}
