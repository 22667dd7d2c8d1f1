//
// Created by gregorian-rayne on 1/13/26.
//

#include "cova/serialization.hpp"
#include "cova/analysis/aggregator.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cova::serialization {

    namespace {

        using json = nlohmann::json;

        double duration_to_ms(const Duration d) {
            return static_cast<double>(
                std::chrono::duration_cast<std::chrono::microseconds>(d).count()
            ) / 1000.0;
        }

        Duration ms_to_duration(const double ms) {
            return std::chrono::duration_cast<Duration>(
                std::chrono::microseconds(static_cast<int64_t>(ms * 1000))
            );
        }

        json optional_string(const std::optional<std::string>& value) {
            return value ? json(*value) : json(nullptr);
        }

        std::optional<std::string> read_optional_string(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) {
                return std::nullopt;
            }
            return j.at(key).get<std::string>();
        }

        std::vector<std::string> read_strings(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) {
                return {};
            }
            return j.at(key).get<std::vector<std::string>>();
        }

        // ---------------------------------------------------------------------
        // Tree nodes
        // ---------------------------------------------------------------------

        json serialize_line(const LineCoverage& line) {
            json j;
            j["line_number"] = line.line_number;
            j["hit_count"] = line.hit_count;
            j["status"] = to_string(line.status);
            if (!line.source_code.empty()) {
                j["source_code"] = line.source_code;
            }
            return j;
        }

        LineCoverage deserialize_line(const json& j) {
            LineCoverage line;
            line.line_number = j.value("line_number", 0);
            line.hit_count = j.value("hit_count", 0);
            line.status = coverage_status_from_string(j.value("status", ""))
                .value_or(line.hit_count > 0 ? CoverageStatus::Covered : CoverageStatus::Uncovered);
            line.source_code = j.value("source_code", "");
            return line;
        }

        json serialize_branch(const BranchCoverage& branch) {
            json j;
            j["line_number"] = branch.line_number;
            j["branch_number"] = branch.branch_number;
            j["hit_count"] = branch.hit_count;
            j["condition"] = branch.condition;
            j["type"] = to_string(branch.type);
            return j;
        }

        BranchCoverage deserialize_branch(const json& j) {
            BranchCoverage branch;
            branch.line_number = j.value("line_number", 0);
            branch.branch_number = j.value("branch_number", 0);
            branch.hit_count = j.value("hit_count", 0);
            branch.condition = j.value("condition", "");
            branch.type = branch_type_from_string(j.value("type", "")).value_or(BranchType::Conditional);
            return branch;
        }

        template<typename T, typename F>
        json serialize_list(const std::vector<T>& items, F&& serialize_item) {
            json array = json::array();
            for (const auto& item : items) {
                array.push_back(serialize_item(item));
            }
            return array;
        }

        template<typename T, typename F>
        std::vector<T> deserialize_list(const json& j, const char* key, F&& deserialize_item) {
            std::vector<T> items;
            if (j.contains(key)) {
                for (const auto& item : j.at(key)) {
                    items.push_back(deserialize_item(item));
                }
            }
            return items;
        }

        CoverageSummary read_summary(const json& j) {
            CoverageSummary s;
            s.total_lines = j.value("total_lines", 0);
            s.covered_lines = j.value("covered_lines", 0);
            s.uncovered_lines = j.value("uncovered_lines", s.total_lines - s.covered_lines);
            s.lines_covered_percentage = j.value("lines_covered_percentage", 0.0);
            s.total_branches = j.value("total_branches", 0);
            s.covered_branches = j.value("covered_branches", 0);
            s.uncovered_branches = j.value("uncovered_branches", s.total_branches - s.covered_branches);
            s.branches_covered_percentage = j.value("branches_covered_percentage", 0.0);
            s.total_methods = j.value("total_methods", 0);
            s.covered_methods = j.value("covered_methods", 0);
            s.uncovered_methods = j.value("uncovered_methods", s.total_methods - s.covered_methods);
            s.methods_covered_percentage = j.value("methods_covered_percentage", 0.0);
            s.total_classes = j.value("total_classes", 0);
            s.covered_classes = j.value("covered_classes", 0);
            s.uncovered_classes = j.value("uncovered_classes", s.total_classes - s.covered_classes);
            s.classes_covered_percentage = j.value("classes_covered_percentage", 0.0);
            return s;
        }

        MethodCoverage deserialize_method(const json& j) {
            MethodCoverage method;
            method.name = j.value("name", "");
            method.class_name = j.value("class_name", "");
            method.signature = j.value("signature", "");
            method.start_line = j.value("start_line", 0);
            method.end_line = j.value("end_line", 0);
            if (j.contains("summary")) {
                method.summary = read_summary(j.at("summary"));
            }
            method.lines = deserialize_list<LineCoverage>(j, "lines", deserialize_line);
            method.branches = deserialize_list<BranchCoverage>(j, "branches", deserialize_branch);
            return method;
        }

        json serialize_class(const ClassCoverage& cls) {
            json j;
            j["name"] = cls.name;
            j["namespace"] = cls.namespace_name;
            j["file_path"] = cls.file_path;
            j["summary"] = serialize(cls.summary);
            j["methods"] = serialize_list(cls.methods, [](const MethodCoverage& m) { return serialize(m); });
            j["lines"] = serialize_list(cls.lines, serialize_line);
            j["branches"] = serialize_list(cls.branches, serialize_branch);
            return j;
        }

        ClassCoverage deserialize_class(const json& j) {
            ClassCoverage cls;
            cls.name = j.value("name", "");
            cls.namespace_name = j.value("namespace", "");
            cls.file_path = j.value("file_path", "");
            if (j.contains("summary")) {
                cls.summary = read_summary(j.at("summary"));
            }
            cls.methods = deserialize_list<MethodCoverage>(j, "methods", deserialize_method);
            cls.lines = deserialize_list<LineCoverage>(j, "lines", deserialize_line);
            cls.branches = deserialize_list<BranchCoverage>(j, "branches", deserialize_branch);
            return cls;
        }

        /**
         * Files repeat class data, so only their summaries are written.
         */
        json serialize_file(const FileCoverage& file) {
            json j;
            j["file_path"] = file.file_path;
            j["file_name"] = file.file_name;
            j["summary"] = serialize(file.summary);
            return j;
        }

        ProjectCoverage deserialize_project(const json& j) {
            ProjectCoverage project;
            project.name = j.value("name", "");
            project.path = j.value("path", "");
            if (j.contains("summary")) {
                project.summary = read_summary(j.at("summary"));
            }
            project.classes = deserialize_list<ClassCoverage>(j, "classes", deserialize_class);
            project.files = analysis::build_file_coverage(project.classes);
            return project;
        }

        json serialize_failure(const TestFailure& failure) {
            json j;
            j["test_name"] = failure.test_name;
            j["test_class"] = failure.test_class;
            j["error_message"] = failure.error_message;
            j["stack_trace"] = failure.stack_trace;
            return j;
        }

        TestFailure deserialize_failure(const json& j) {
            TestFailure failure;
            failure.test_name = j.value("test_name", "");
            failure.test_class = j.value("test_class", "");
            failure.error_message = j.value("error_message", "");
            failure.stack_trace = j.value("stack_trace", "");
            return failure;
        }

        TestExecutionSummary deserialize_test_summary(const json& j) {
            TestExecutionSummary summary;
            summary.total_tests = j.value("total_tests", 0);
            summary.passed_tests = j.value("passed_tests", 0);
            summary.failed_tests = j.value("failed_tests", 0);
            summary.skipped_tests = j.value("skipped_tests", 0);
            summary.execution_time = ms_to_duration(j.value("execution_time_ms", 0.0));
            summary.failures = deserialize_list<TestFailure>(j, "failures", deserialize_failure);
            return summary;
        }

        json serialize_run(const ProjectRunOutcome& run) {
            json j;
            j["project_name"] = run.project_name;
            j["project_path"] = run.project_path;
            j["success"] = run.success;
            j["error_message"] = run.error_message;
            j["timed_out"] = run.timed_out;
            j["duration_ms"] = duration_to_ms(run.duration);
            j["coverage_file"] = optional_string(run.coverage_file);
            return j;
        }

        ProjectRunOutcome deserialize_run(const json& j) {
            ProjectRunOutcome run;
            run.project_name = j.value("project_name", "");
            run.project_path = j.value("project_path", "");
            run.success = j.value("success", false);
            run.error_message = j.value("error_message", "");
            run.timed_out = j.value("timed_out", false);
            run.duration = ms_to_duration(j.value("duration_ms", 0.0));
            run.coverage_file = read_optional_string(j, "coverage_file");
            return run;
        }

        json serialize_change(const FileCoverageChange& change) {
            json j;
            j["file_path"] = change.file_path;
            j["baseline_percentage"] = change.baseline_percentage;
            j["current_percentage"] = change.current_percentage;
            j["change"] = change.change();
            return j;
        }

        json serialize_delta(const CoverageDelta& delta) {
            json j;
            j["lines_coverage_change"] = delta.lines_coverage_change;
            j["branches_coverage_change"] = delta.branches_coverage_change;
            j["methods_coverage_change"] = delta.methods_coverage_change;
            j["classes_coverage_change"] = delta.classes_coverage_change;
            j["lines_change"] = delta.lines_change;
            j["branches_change"] = delta.branches_change;
            j["methods_change"] = delta.methods_change;
            j["classes_change"] = delta.classes_change;
            j["trend"] = to_string(delta.trend());
            return j;
        }

    }  // namespace

    std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);
        std::ostringstream ss;
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::optional<Timestamp> parse_timestamp(const std::string& text) {
        std::tm tm = {};
        std::istringstream ss(text);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        if (ss.fail()) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    json serialize(const CoverageAnalysisOptions& options) {
        json j;
        j["included_projects"] = options.included_projects;
        j["excluded_projects"] = options.excluded_projects;
        j["included_test_projects"] = options.included_test_projects;
        j["excluded_test_projects"] = options.excluded_test_projects;
        j["excluded_files"] = options.excluded_files;
        j["include_generated_code"] = options.include_generated_code;
        j["collect_branch_coverage"] = options.collect_branch_coverage;
        j["collect_method_coverage"] = options.collect_method_coverage;
        j["timeout_minutes"] = options.timeout_minutes;
        j["output_format"] = options.output_format;
        j["run_in_parallel"] = options.run_in_parallel;
        j["test_filter"] = optional_string(options.test_filter);
        return j;
    }

    json serialize(const CoverageSummary& summary) {
        json j;
        j["total_lines"] = summary.total_lines;
        j["covered_lines"] = summary.covered_lines;
        j["uncovered_lines"] = summary.uncovered_lines;
        j["lines_covered_percentage"] = summary.lines_covered_percentage;
        j["total_branches"] = summary.total_branches;
        j["covered_branches"] = summary.covered_branches;
        j["uncovered_branches"] = summary.uncovered_branches;
        j["branches_covered_percentage"] = summary.branches_covered_percentage;
        j["total_methods"] = summary.total_methods;
        j["covered_methods"] = summary.covered_methods;
        j["uncovered_methods"] = summary.uncovered_methods;
        j["methods_covered_percentage"] = summary.methods_covered_percentage;
        j["total_classes"] = summary.total_classes;
        j["covered_classes"] = summary.covered_classes;
        j["uncovered_classes"] = summary.uncovered_classes;
        j["classes_covered_percentage"] = summary.classes_covered_percentage;
        return j;
    }

    json serialize(const TestExecutionSummary& summary) {
        json j;
        j["total_tests"] = summary.total_tests;
        j["passed_tests"] = summary.passed_tests;
        j["failed_tests"] = summary.failed_tests;
        j["skipped_tests"] = summary.skipped_tests;
        j["execution_time_ms"] = duration_to_ms(summary.execution_time);
        j["failures"] = serialize_list(summary.failures, serialize_failure);
        return j;
    }

    json serialize(const MethodCoverage& method) {
        json j;
        j["name"] = method.name;
        j["class_name"] = method.class_name;
        j["signature"] = method.signature;
        j["start_line"] = method.start_line;
        j["end_line"] = method.end_line;
        j["summary"] = serialize(method.summary);
        j["lines"] = serialize_list(method.lines, serialize_line);
        j["branches"] = serialize_list(method.branches, serialize_branch);
        return j;
    }

    json serialize(const ProjectCoverage& project) {
        json j;
        j["name"] = project.name;
        j["path"] = project.path;
        j["summary"] = serialize(project.summary);
        j["files"] = serialize_list(project.files, serialize_file);
        j["classes"] = serialize_list(project.classes, serialize_class);
        return j;
    }

    json serialize(const CoverageAnalysisResult& result) {
        json j;
        j["success"] = result.success;
        j["error_message"] = optional_string(result.error_message);
        j["analysis_time"] = format_timestamp(result.analysis_time);
        j["execution_duration_ms"] = duration_to_ms(result.execution_duration);
        j["summary"] = serialize(result.summary);
        j["projects"] = serialize_list(result.projects, [](const ProjectCoverage& p) { return serialize(p); });
        j["test_results"] = serialize(result.test_results);
        j["project_runs"] = serialize_list(result.project_runs, serialize_run);
        return j;
    }

    json serialize(const CoverageSummaryResult& result) {
        json j;
        j["success"] = result.success;
        j["error_message"] = optional_string(result.error_message);
        j["summary"] = serialize(result.summary);
        return j;
    }

    json serialize(const UncoveredCodeResult& result) {
        json j;
        j["success"] = result.success;
        j["error_message"] = optional_string(result.error_message);
        j["total_uncovered_items"] = result.total_uncovered_items();

        j["uncovered_methods"] = serialize_list(result.uncovered_methods, [](const UncoveredMethod& m) {
            json item;
            item["method_name"] = m.method_name;
            item["class_name"] = m.class_name;
            item["file_path"] = m.file_path;
            item["start_line"] = m.start_line;
            item["end_line"] = m.end_line;
            item["signature"] = m.signature;
            item["line_count"] = m.line_count;
            item["reason"] = m.reason;
            return item;
        });
        j["uncovered_lines"] = serialize_list(result.uncovered_lines, [](const UncoveredLine& l) {
            json item;
            item["file_path"] = l.file_path;
            item["line_number"] = l.line_number;
            item["source_code"] = l.source_code;
            item["method_name"] = l.method_name;
            item["class_name"] = l.class_name;
            return item;
        });
        j["uncovered_branches"] = serialize_list(result.uncovered_branches, [](const UncoveredBranch& b) {
            json item;
            item["file_path"] = b.file_path;
            item["line_number"] = b.line_number;
            item["branch_number"] = b.branch_number;
            item["condition"] = b.condition;
            item["type"] = to_string(b.type);
            item["method_name"] = b.method_name;
            item["class_name"] = b.class_name;
            return item;
        });
        return j;
    }

    json serialize(const MethodCoverageResult& result) {
        json j;
        j["success"] = result.success;
        j["error_message"] = optional_string(result.error_message);
        j["method"] = result.method ? serialize(*result.method) : json(nullptr);
        return j;
    }

    json serialize(const CoverageComparisonResult& result) {
        json j;
        j["success"] = result.success;
        j["error_message"] = optional_string(result.error_message);
        j["baseline"] = serialize(result.baseline);
        j["current"] = serialize(result.current);
        j["delta"] = serialize_delta(result.delta);
        j["improved_files"] = serialize_list(result.improved_files, serialize_change);
        j["regressed_files"] = serialize_list(result.regressed_files, serialize_change);
        j["added_files"] = result.added_files;
        j["removed_files"] = result.removed_files;
        j["newly_uncovered_methods"] = result.newly_uncovered_methods;
        j["newly_covered_methods"] = result.newly_covered_methods;
        return j;
    }

    Result<CoverageAnalysisOptions, Error> deserialize_options(const json& j) {
        if (!j.is_object()) {
            return Result<CoverageAnalysisOptions, Error>::failure(
                Error::parse_error("analysis options must be a JSON object")
            );
        }

        try {
            CoverageAnalysisOptions options;
            options.included_projects = read_strings(j, "included_projects");
            options.excluded_projects = read_strings(j, "excluded_projects");
            options.included_test_projects = read_strings(j, "included_test_projects");
            options.excluded_test_projects = read_strings(j, "excluded_test_projects");
            options.excluded_files = read_strings(j, "excluded_files");
            options.include_generated_code = j.value("include_generated_code", options.include_generated_code);
            options.collect_branch_coverage = j.value("collect_branch_coverage", options.collect_branch_coverage);
            options.collect_method_coverage = j.value("collect_method_coverage", options.collect_method_coverage);
            options.timeout_minutes = j.value("timeout_minutes", options.timeout_minutes);
            options.output_format = j.value("output_format", options.output_format);
            options.run_in_parallel = j.value("run_in_parallel", options.run_in_parallel);
            options.test_filter = read_optional_string(j, "test_filter");
            return Result<CoverageAnalysisOptions, Error>::success(std::move(options));
        } catch (const json::exception& e) {
            return Result<CoverageAnalysisOptions, Error>::failure(
                Error::parse_error(std::string("invalid analysis options: ") + e.what())
            );
        }
    }

    Result<CoverageSummary, Error> deserialize_summary(const json& j) {
        if (!j.is_object()) {
            return Result<CoverageSummary, Error>::failure(Error::parse_error("coverage summary must be a JSON object"));
        }
        try {
            return Result<CoverageSummary, Error>::success(read_summary(j));
        } catch (const json::exception& e) {
            return Result<CoverageSummary, Error>::failure(
                Error::parse_error(std::string("invalid coverage summary: ") + e.what())
            );
        }
    }

    Result<CoverageAnalysisResult, Error> deserialize_analysis(const json& j) {
        if (!j.is_object()) {
            return Result<CoverageAnalysisResult, Error>::failure(
                Error::parse_error("analysis result must be a JSON object")
            );
        }

        try {
            CoverageAnalysisResult result;
            result.success = j.value("success", false);
            result.error_message = read_optional_string(j, "error_message");
            result.analysis_time = parse_timestamp(j.value("analysis_time", "")).value_or(Timestamp{});
            result.execution_duration = ms_to_duration(j.value("execution_duration_ms", 0.0));
            if (j.contains("summary")) {
                result.summary = read_summary(j.at("summary"));
            }
            result.projects = deserialize_list<ProjectCoverage>(j, "projects", deserialize_project);
            if (j.contains("test_results")) {
                result.test_results = deserialize_test_summary(j.at("test_results"));
            }
            result.project_runs = deserialize_list<ProjectRunOutcome>(j, "project_runs", deserialize_run);
            return Result<CoverageAnalysisResult, Error>::success(std::move(result));
        } catch (const json::exception& e) {
            return Result<CoverageAnalysisResult, Error>::failure(
                Error::parse_error(std::string("invalid analysis result: ") + e.what())
            );
        }
    }

    Result<CoverageAnalysisOptions, Error> options_from_string(const std::string& text) {
        try {
            return deserialize_options(json::parse(text));
        } catch (const json::parse_error& e) {
            return Result<CoverageAnalysisOptions, Error>::failure(
                Error::parse_error(std::string("analysis options are not valid JSON: ") + e.what())
            );
        }
    }

}  // namespace cova::serialization
