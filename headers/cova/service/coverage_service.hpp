//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef COVA_COVERAGE_SERVICE_HPP
#define COVA_COVERAGE_SERVICE_HPP

/**
 * @file coverage_service.hpp
 * @brief Entry point for coverage operations on a loaded workspace.
 *
 * The service holds the workspace for the session and runs one test
 * process per selected test project on each call. Operations never
 * throw: every failure is reported through the result's success flag and
 * message, and per-project failures stay visible in project_runs.
 *
 * @code
 *     auto toolchain = runner::locate_toolchain(config.toolchain);
 *     service::CoverageService svc(
 *         std::make_shared<runner::DotnetTestDriver>(toolchain.value()), settings);
 *     svc.load_workspace("MyApp.sln");
 *     auto result = svc.run_coverage_analysis(options);
 * @endcode
 */

#include "cova/result.hpp"
#include "cova/error.hpp"
#include "cova/types.hpp"
#include "cova/runner/process.hpp"
#include "cova/runner/test_driver.hpp"
#include "cova/runner/test_runner.hpp"
#include "cova/workspace/workspace.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace cova::service {

    inline constexpr const char* kNoWorkspaceMessage = "No workspace loaded. Please load a workspace first.";
    inline constexpr const char* kNoTestProjectsMessage = "No test projects found in the workspace.";
    inline constexpr const char* kNoCoverageMessage = "No coverage data was generated.";

    /// Upper bound accepted for options.timeout_minutes (one day).
    inline constexpr int kMaxTimeoutMinutes = 24 * 60;

    class CoverageService {
    public:
        CoverageService(std::shared_ptr<const runner::ITestDriver> driver, runner::RunnerSettings settings);

        /**
         * Loads a solution, project or directory and makes it current.
         * The previous workspace stays current when loading fails.
         */
        Result<void, Error> load_workspace(const fs::path& path);

        void set_workspace(workspace::Workspace ws);
        void clear_workspace();

        [[nodiscard]] bool has_workspace() const;
        [[nodiscard]] std::shared_ptr<const workspace::Workspace> current_workspace() const;

        [[nodiscard]] CoverageAnalysisResult run_coverage_analysis(
            const CoverageAnalysisOptions& options = {},
            const runner::CancellationToken& cancel = runner::CancellationToken{}
        ) const;

        [[nodiscard]] CoverageSummaryResult get_coverage_summary(
            const CoverageAnalysisOptions& options = {},
            const runner::CancellationToken& cancel = runner::CancellationToken{}
        ) const;

        [[nodiscard]] UncoveredCodeResult find_uncovered_code(
            const CoverageAnalysisOptions& options = {},
            const runner::CancellationToken& cancel = runner::CancellationToken{}
        ) const;

        /**
         * Finds one method by class and method name, ignoring case. The
         * class may be given fully qualified or by its simple name.
         */
        [[nodiscard]] MethodCoverageResult get_method_coverage(
            const std::string& class_name,
            const std::string& method_name,
            const CoverageAnalysisOptions& options = {},
            const runner::CancellationToken& cancel = runner::CancellationToken{}
        ) const;

        /**
         * Runs a fresh analysis and diffs it against @p baseline. An
         * unusable baseline fails the comparison before any test runs.
         */
        [[nodiscard]] CoverageComparisonResult compare_coverage(
            const CoverageAnalysisResult& baseline,
            const CoverageAnalysisOptions& options = {},
            const runner::CancellationToken& cancel = runner::CancellationToken{}
        ) const;

        [[nodiscard]] static Result<void, Error> validate_options(const CoverageAnalysisOptions& options);

        /**
         * Finds a method in an existing result. Used by get_method_coverage().
         */
        [[nodiscard]] static std::optional<MethodCoverage> find_method(
            const CoverageAnalysisResult& result,
            const std::string& class_name,
            const std::string& method_name
        );

    private:
        CoverageAnalysisResult analyze(const workspace::Workspace& ws,
                                       const CoverageAnalysisOptions& options,
                                       const runner::CancellationToken& cancel) const;

        std::shared_ptr<const runner::ITestDriver> driver_;
        runner::RunnerSettings settings_;

        mutable std::mutex mutex_;
        std::shared_ptr<const workspace::Workspace> workspace_;
    };

}  // namespace cova::service

#endif //COVA_COVERAGE_SERVICE_HPP
