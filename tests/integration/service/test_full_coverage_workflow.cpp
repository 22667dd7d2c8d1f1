//
// Created by gregorian-rayne on 1/17/26.
//

#include "cova/service/coverage_service.hpp"
#include "cova/storage/snapshot_store.hpp"
#include "support/coverage_fixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using namespace cova;
using namespace cova::service;
using namespace std::chrono_literals;
using Behavior = cova::testing::ScriptTestDriver::Behavior;

/**
 * Drives a workspace on disk through load, run, report, snapshot and
 * compare with the scripted test driver standing in for dotnet.
 */
class FullCoverageWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "cova_workflow_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir / "scratch");

        write("Calc/src/Calc.Core/Calc.Core.csproj", cova::testing::library_project());
        write("Calc/src/Calc.Core/Calculator.cs", "namespace Calc.Core { public class Calculator {} }");
        write("Calc/tests/Calc.Tests/Calc.Tests.csproj", cova::testing::xunit_project());
        write("Calc/tests/Calc.Slow.Tests/Calc.Slow.Tests.csproj", cova::testing::xunit_project());

        driver = std::make_shared<cova::testing::ScriptTestDriver>(temp_dir / "scratch");
        runner::RunnerSettings settings;
        settings.results_root = ".cova/results";
        settings.max_parallel = 2;
        settings.kill_grace = 200ms;
        service = std::make_unique<CoverageService>(driver, settings);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void write(const fs::path& relative, const std::string& content) const {
        ASSERT_TRUE(file_utils::write_file(temp_dir / relative, content).is_ok());
    }

    static Behavior passing(const bool reset_covered, const int tests = 4) {
        return {cova::testing::passing_transcript(tests), cova::testing::calculator_report(reset_covered), 0};
    }

    static CoverageAnalysisOptions fast_only() {
        CoverageAnalysisOptions options;
        options.excluded_test_projects = {"Calc.Slow.Tests"};
        options.timeout_minutes = 2;
        return options;
    }

    fs::path temp_dir;
    std::shared_ptr<cova::testing::ScriptTestDriver> driver;
    std::unique_ptr<CoverageService> service;
};

TEST_F(FullCoverageWorkflowTest, AnalyzeReportSnapshotAndCompare) {
    ASSERT_TRUE(service->load_workspace(temp_dir / "Calc").is_ok());
    ASSERT_EQ(service->current_workspace()->projects.size(), 3u);

    driver->set("Calc.Tests", passing(false));
    driver->set("Calc.Slow.Tests", passing(false, 9));

    // Full run
    const auto baseline = service->run_coverage_analysis(fast_only());
    ASSERT_TRUE(baseline.success) << baseline.error_message.value_or("");
    EXPECT_EQ(driver->invocations(), 1);
    ASSERT_EQ(baseline.project_runs.size(), 1u);
    EXPECT_EQ(baseline.project_runs[0].project_name, "Calc.Tests");
    ASSERT_TRUE(baseline.project_runs[0].coverage_file.has_value());
    EXPECT_TRUE(fs::exists(*baseline.project_runs[0].coverage_file));
    EXPECT_TRUE(fs::exists(temp_dir / "Calc" / ".cova" / "results" / "Calc.Tests"));
    EXPECT_EQ(baseline.test_results.total_tests, 4);
    EXPECT_EQ(baseline.summary.total_lines, 7);
    EXPECT_EQ(baseline.summary.covered_lines, 4);
    EXPECT_EQ(baseline.summary.total_methods, 4);
    EXPECT_EQ(baseline.summary.covered_methods, 3);

    // Summary
    const auto summary = service->get_coverage_summary(fast_only());
    ASSERT_TRUE(summary.success);
    EXPECT_DOUBLE_EQ(summary.summary.lines_covered_percentage, 57.14);

    // Uncovered code
    const auto uncovered = service->find_uncovered_code(fast_only());
    ASSERT_TRUE(uncovered.success);
    ASSERT_EQ(uncovered.uncovered_methods.size(), 1u);
    EXPECT_EQ(uncovered.uncovered_methods[0].class_name, "Calc.Core.Calculator");
    EXPECT_EQ(uncovered.uncovered_methods[0].start_line, 20);
    EXPECT_EQ(uncovered.uncovered_methods[0].line_count, 2);
    ASSERT_EQ(uncovered.uncovered_branches.size(), 1u);
    EXPECT_EQ(uncovered.uncovered_branches[0].line_number, 16);

    // One method
    const auto reset = service->get_method_coverage("Calculator", "Reset", fast_only());
    ASSERT_TRUE(reset.success);
    ASSERT_TRUE(reset.method.has_value());
    EXPECT_TRUE(reset.method->is_uncovered());
    EXPECT_EQ(reset.method->lines.size(), 2u);

    // Snapshot round trip
    const storage::SnapshotStore store(temp_dir / "snapshots");
    ASSERT_TRUE(store.save("before-reset-tests", baseline, "Reset not covered", {"ci"}).is_ok());
    ASSERT_TRUE(store.set_baseline("before-reset-tests").is_ok());
    EXPECT_EQ(store.get_baseline(), std::optional<std::string>("before-reset-tests"));

    auto stored = store.load(*store.get_baseline());
    ASSERT_TRUE(stored.is_ok()) << stored.error().to_string();
    EXPECT_EQ(stored.value().metadata.description, "Reset not covered");
    EXPECT_EQ(stored.value().analysis.summary, baseline.summary);

    // New tests cover Reset
    driver->set("Calc.Tests", passing(true, 5));
    const auto comparison = service->compare_coverage(stored.value().analysis, fast_only());
    ASSERT_TRUE(comparison.success) << comparison.error_message.value_or("");
    EXPECT_EQ(comparison.baseline, baseline.summary);
    EXPECT_EQ(comparison.current.covered_lines, 6);
    EXPECT_DOUBLE_EQ(comparison.delta.lines_coverage_change, 28.57);
    EXPECT_EQ(comparison.delta.lines_change, 2);
    EXPECT_EQ(comparison.delta.methods_change, 1);
    EXPECT_EQ(comparison.delta.trend(), DeltaTrend::Improved);
    EXPECT_EQ(comparison.newly_covered_methods, (std::vector<std::string>{"Calc.Core.Calculator::Reset()"}));
    EXPECT_TRUE(comparison.newly_uncovered_methods.empty());
    ASSERT_EQ(comparison.improved_files.size(), 1u);
    EXPECT_NE(comparison.improved_files[0].file_path.find("Calculator.cs"), std::string::npos);
    EXPECT_TRUE(comparison.regressed_files.empty());
    EXPECT_TRUE(comparison.added_files.empty());
    EXPECT_TRUE(comparison.removed_files.empty());
}

TEST_F(FullCoverageWorkflowTest, ComparingARunWithItselfIsUnchanged) {
    ASSERT_TRUE(service->load_workspace(temp_dir / "Calc").is_ok());
    driver->set("Calc.Tests", passing(false));

    const auto baseline = service->run_coverage_analysis(fast_only());
    ASSERT_TRUE(baseline.success);

    const auto comparison = service->compare_coverage(baseline, fast_only());
    ASSERT_TRUE(comparison.success);
    EXPECT_TRUE(comparison.delta.is_unchanged());
    EXPECT_TRUE(comparison.improved_files.empty());
    EXPECT_TRUE(comparison.regressed_files.empty());
    EXPECT_TRUE(comparison.newly_covered_methods.empty());
    EXPECT_TRUE(comparison.newly_uncovered_methods.empty());
}

TEST_F(FullCoverageWorkflowTest, FailingTestsStillReportCoverage) {
    ASSERT_TRUE(service->load_workspace(temp_dir / "Calc").is_ok());

    Behavior failing;
    failing.transcript = {
        "  Failed Calc.Tests.CalculatorTests.DividesByZero [4 ms]",
        "  Error Message:",
        "   System.DivideByZeroException : Attempted to divide by zero.",
        "Failed!  - Failed:     1, Passed:     3, Skipped:     0, Total:     4, Duration: 1 s - Calc.Tests.dll (net8.0)",
    };
    failing.report = cova::testing::calculator_report(false);
    failing.exit_code = 1;
    driver->set("Calc.Tests", failing);

    const auto result = service->run_coverage_analysis(fast_only());
    ASSERT_TRUE(result.success) << result.error_message.value_or("");
    ASSERT_EQ(result.project_runs.size(), 1u);
    EXPECT_TRUE(result.project_runs[0].success);
    EXPECT_EQ(result.test_results.failed_tests, 1);
    ASSERT_EQ(result.test_results.failures.size(), 1u);
    EXPECT_EQ(result.test_results.failures[0].test_name, "DividesByZero");
    EXPECT_EQ(result.summary.covered_lines, 4);
}

TEST_F(FullCoverageWorkflowTest, WorkspaceWithoutTestProjects) {
    ASSERT_TRUE(service->load_workspace(temp_dir / "Calc" / "src").is_ok());

    const auto result = service->run_coverage_analysis();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, std::optional<std::string>(kNoTestProjectsMessage));
    EXPECT_EQ(driver->invocations(), 0);
}
