//
// Created by gregorian-rayne on 1/14/26.
//

#include "cova/service/coverage_service.hpp"
#include "cova/analysis/aggregator.hpp"
#include "cova/analysis/comparison.hpp"
#include "cova/analysis/uncovered_extractor.hpp"
#include "cova/discovery/project_discovery.hpp"
#include "cova/parsers/cobertura_parser.hpp"
#include "cova/parsers/test_summary_parser.hpp"
#include "cova/utils/string_utils.hpp"

#include <redlog.hpp>

#include <algorithm>
#include <iterator>

namespace cova::service {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.service");

        std::string simple_class_name(const std::string& name) {
            const auto outer_end = name.find('/');
            const auto dot = name.rfind('.', outer_end == std::string::npos ? std::string::npos : outer_end);
            return dot == std::string::npos ? name : name.substr(dot + 1);
        }

        ProjectRunOutcome to_outcome(const runner::ProjectRunResult& run) {
            ProjectRunOutcome outcome;
            outcome.project_name = run.project_name;
            outcome.project_path = run.project_path.string();
            outcome.success = run.success;
            outcome.error_message = run.error ? run.error->message() : std::string{};
            outcome.timed_out = run.timed_out;
            outcome.duration = run.duration;
            if (run.coverage_file) {
                outcome.coverage_file = run.coverage_file->string();
            }
            return outcome;
        }

    }  // namespace

    CoverageService::CoverageService(std::shared_ptr<const runner::ITestDriver> driver, runner::RunnerSettings settings)
        : driver_(std::move(driver))
        , settings_(std::move(settings)) {}

    Result<void, Error> CoverageService::load_workspace(const fs::path& path) {
        auto loaded = workspace::WorkspaceLoader::load(path);
        if (loaded.is_err()) {
            log_.err("workspace load failed", redlog::field("path", path.string()),
                     redlog::field("error", loaded.error().to_string()));
            return Result<void, Error>::failure(loaded.error());
        }
        set_workspace(std::move(loaded).value());
        return Result<void, Error>::success();
    }

    void CoverageService::set_workspace(workspace::Workspace ws) {
        auto shared = std::make_shared<const workspace::Workspace>(std::move(ws));
        std::lock_guard lock(mutex_);
        workspace_ = std::move(shared);
    }

    void CoverageService::clear_workspace() {
        std::lock_guard lock(mutex_);
        workspace_.reset();
    }

    bool CoverageService::has_workspace() const {
        std::lock_guard lock(mutex_);
        return workspace_ != nullptr;
    }

    std::shared_ptr<const workspace::Workspace> CoverageService::current_workspace() const {
        std::lock_guard lock(mutex_);
        return workspace_;
    }

    Result<void, Error> CoverageService::validate_options(const CoverageAnalysisOptions& options) {
        if (options.timeout_minutes < 1 || options.timeout_minutes > kMaxTimeoutMinutes) {
            return Result<void, Error>::failure(Error::invalid_argument(
                "timeout_minutes must be between 1 and " + std::to_string(kMaxTimeoutMinutes) +
                ", got " + std::to_string(options.timeout_minutes)
            ));
        }
        if (options.output_format != "json" && options.output_format != "text") {
            return Result<void, Error>::failure(Error::invalid_argument(
                "output_format must be 'json' or 'text', got '" + options.output_format + "'"
            ));
        }
        return Result<void, Error>::success();
    }

    CoverageAnalysisResult CoverageService::run_coverage_analysis(
        const CoverageAnalysisOptions& options,
        const runner::CancellationToken& cancel
    ) const {
        CoverageAnalysisResult result;
        result.analysis_time = std::chrono::system_clock::now();

        const auto ws = current_workspace();
        if (!ws) {
            log_.err("coverage analysis rejected", redlog::field("error", kNoWorkspaceMessage));
            result.error_message = kNoWorkspaceMessage;
            return result;
        }

        if (auto valid = validate_options(options); valid.is_err()) {
            result.error_message = valid.error().message();
            return result;
        }

        const auto start = std::chrono::steady_clock::now();
        try {
            result = analyze(*ws, options, cancel);
        } catch (const std::exception& e) {
            log_.err("coverage analysis aborted", redlog::field("error", e.what()));
            result.success = false;
            result.error_message = std::string("Coverage analysis failed: ") + e.what();
        }
        result.execution_duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

        log_.inf("coverage analysis finished", redlog::field("success", result.success),
                 redlog::field("projects", result.projects.size()),
                 redlog::field("lines_pct", result.summary.lines_covered_percentage),
                 redlog::field("duration", string_utils::format_duration(result.execution_duration.count())));
        return result;
    }

    CoverageAnalysisResult CoverageService::analyze(
        const workspace::Workspace& ws,
        const CoverageAnalysisOptions& options,
        const runner::CancellationToken& cancel
    ) const {
        CoverageAnalysisResult result;
        result.analysis_time = std::chrono::system_clock::now();

        const auto test_projects = discovery::select_test_projects(ws.projects, options);
        log_.inf("test projects selected", redlog::field("count", test_projects.size()),
                 redlog::field("workspace", ws.root.string()));

        if (test_projects.empty()) {
            result.error_message = kNoTestProjectsMessage;
            return result;
        }

        auto settings = settings_;
        if (!settings.results_root.empty() && settings.results_root.is_relative()) {
            settings.results_root = ws.root / settings.results_root;
        }
        const runner::TestRunner test_runner(driver_, settings);
        auto runs = test_runner.run_all(test_projects, options, cancel);

        const auto parse_options = parsers::ReportParseOptions::from(options);
        std::vector<ProjectCoverage> collected;
        bool any_report = false;

        for (const auto& run : runs) {
            auto outcome = to_outcome(run);

            if (run.success) {
                parsers::merge_test_summary(result.test_results, parsers::parse_test_results(run.output_lines));

                if (run.coverage_file) {
                    auto parsed = parsers::parse_report_file(*run.coverage_file, parse_options);
                    if (parsed.is_ok()) {
                        any_report = true;
                        auto projects = std::move(parsed).value();
                        std::ranges::move(projects, std::back_inserter(collected));
                    } else {
                        log_.wrn("coverage report unreadable", redlog::field("project", run.project_name),
                                 redlog::field("error", parsed.error().to_string()));
                        outcome.success = false;
                        outcome.error_message = "Coverage report could not be parsed: " + parsed.error().message();
                    }
                }
            }

            result.project_runs.push_back(std::move(outcome));
        }

        std::ranges::sort(result.project_runs, {}, &ProjectRunOutcome::project_name);

        if (cancel.is_cancelled()) {
            result.error_message = "Coverage analysis was cancelled";
            return result;
        }

        if (!any_report) {
            result.error_message = kNoCoverageMessage;
            return result;
        }

        std::erase_if(collected, [&options](const ProjectCoverage& p) {
            return !analysis::project_selected(p.name, options);
        });
        result.projects = analysis::merge_projects(std::move(collected));
        std::ranges::sort(result.projects, {}, &ProjectCoverage::name);

        analysis::calculate_overall_summary(result);
        result.success = true;
        return result;
    }

    CoverageSummaryResult CoverageService::get_coverage_summary(
        const CoverageAnalysisOptions& options,
        const runner::CancellationToken& cancel
    ) const {
        const auto analysis = run_coverage_analysis(options, cancel);

        CoverageSummaryResult result;
        result.success = analysis.success;
        result.error_message = analysis.error_message;
        if (analysis.success) {
            result.summary = analysis.summary;
        }
        return result;
    }

    UncoveredCodeResult CoverageService::find_uncovered_code(
        const CoverageAnalysisOptions& options,
        const runner::CancellationToken& cancel
    ) const {
        const auto analysis = run_coverage_analysis(options, cancel);
        if (!analysis.success) {
            UncoveredCodeResult result;
            result.error_message = analysis.error_message;
            return result;
        }
        return analysis::find_uncovered(analysis, options);
    }

    std::optional<MethodCoverage> CoverageService::find_method(
        const CoverageAnalysisResult& result,
        const std::string& class_name,
        const std::string& method_name
    ) {
        for (const auto& project : result.projects) {
            for (const auto& cls : project.classes) {
                if (!string_utils::iequals(cls.name, class_name) &&
                    !string_utils::iequals(simple_class_name(cls.name), class_name)) {
                    continue;
                }
                const auto it = std::ranges::find_if(cls.methods, [&method_name](const MethodCoverage& m) {
                    return string_utils::iequals(m.name, method_name);
                });
                if (it != cls.methods.end()) {
                    return *it;
                }
            }
        }
        return std::nullopt;
    }

    MethodCoverageResult CoverageService::get_method_coverage(
        const std::string& class_name,
        const std::string& method_name,
        const CoverageAnalysisOptions& options,
        const runner::CancellationToken& cancel
    ) const {
        MethodCoverageResult result;

        if (!has_workspace()) {
            result.error_message = kNoWorkspaceMessage;
            return result;
        }
        if (string_utils::trim(class_name).empty() || string_utils::trim(method_name).empty()) {
            result.error_message = "Class name and method name are required";
            return result;
        }

        const auto analysis = run_coverage_analysis(options, cancel);
        if (!analysis.success) {
            result.error_message = analysis.error_message;
            return result;
        }

        result.method = find_method(analysis, class_name, method_name);
        if (!result.method) {
            result.error_message = Error::not_found(
                "Method '" + method_name + "' not found in class '" + class_name + "'").message();
            return result;
        }
        result.success = true;
        return result;
    }

    CoverageComparisonResult CoverageService::compare_coverage(
        const CoverageAnalysisResult& baseline,
        const CoverageAnalysisOptions& options,
        const runner::CancellationToken& cancel
    ) const {
        CoverageComparisonResult result;

        if (!has_workspace()) {
            result.error_message = kNoWorkspaceMessage;
            return result;
        }

        if (auto valid = analysis::validate_baseline(baseline); valid.is_err()) {
            log_.wrn("comparison rejected", redlog::field("error", valid.error().to_string()));
            result.error_message = valid.error().message();
            result.baseline = baseline.summary;
            return result;
        }

        const auto current = run_coverage_analysis(options, cancel);
        if (!current.success) {
            result.error_message = current.error_message;
            result.baseline = baseline.summary;
            return result;
        }

        result = analysis::compare_results(baseline, current);
        log_.inf("coverage compared", redlog::field("trend", to_string(result.delta.trend())),
                 redlog::field("lines_delta", result.delta.lines_coverage_change));
        return result;
    }

}  // namespace cova::service
