//
// Created by gregorian-rayne on 1/12/26.
//

#include "cova/analysis/uncovered_extractor.hpp"
#include "cova/utils/path_utils.hpp"
#include "cova/utils/string_utils.hpp"

#include <algorithm>
#include <tuple>

namespace cova::analysis {

    namespace {

        /**
         * Innermost method whose line range contains @p line_number.
         */
        const MethodCoverage* enclosing_method(const ClassCoverage& cls, const int line_number) {
            const MethodCoverage* best = nullptr;
            for (const auto& method : cls.methods) {
                if (method.lines.empty() || line_number < method.start_line || line_number > method.end_line) {
                    continue;
                }
                if (!best || method.end_line - method.start_line < best->end_line - best->start_line) {
                    best = &method;
                }
            }
            return best;
        }

        std::string uncovered_reason(const MethodCoverage& method) {
            if (method.lines.empty()) {
                return "No executable lines were instrumented";
            }
            if (method.summary.total_branches > 0) {
                return "Not executed by any test (" + std::to_string(method.summary.total_lines) + " lines, " +
                       std::to_string(method.summary.total_branches) + " branch outcomes)";
            }
            return "Not executed by any test (" + std::to_string(method.summary.total_lines) + " lines)";
        }

        void collect_class(const ClassCoverage& cls, const CoverageAnalysisOptions& options, UncoveredCodeResult& out) {
            const auto file_path = path_utils::normalize_report_path(cls.file_path);

            if (options.collect_method_coverage) {
                for (const auto& method : cls.methods) {
                    if (!method.is_uncovered()) {
                        continue;
                    }
                    UncoveredMethod record;
                    record.method_name = method.name;
                    record.class_name = cls.name;
                    record.file_path = file_path;
                    record.start_line = method.start_line;
                    record.end_line = method.end_line;
                    record.signature = method.signature;
                    record.line_count = method.lines.empty() ? 0 : method.end_line - method.start_line + 1;
                    record.reason = uncovered_reason(method);
                    out.uncovered_methods.push_back(std::move(record));
                }
            }

            for (const auto& line : cls.lines) {
                if (line.is_covered()) {
                    continue;
                }
                UncoveredLine record;
                record.file_path = file_path;
                record.line_number = line.line_number;
                record.source_code = line.source_code;
                record.class_name = cls.name;
                if (const auto* method = enclosing_method(cls, line.line_number)) {
                    record.method_name = method->name;
                }
                out.uncovered_lines.push_back(std::move(record));
            }

            if (options.collect_branch_coverage) {
                for (const auto& branch : cls.branches) {
                    if (branch.is_covered()) {
                        continue;
                    }
                    UncoveredBranch record;
                    record.file_path = file_path;
                    record.line_number = branch.line_number;
                    record.branch_number = branch.branch_number;
                    record.condition = branch.condition;
                    record.type = branch.type;
                    record.class_name = cls.name;
                    if (const auto* method = enclosing_method(cls, branch.line_number)) {
                        record.method_name = method->name;
                    }
                    out.uncovered_branches.push_back(std::move(record));
                }
            }
        }

    }  // namespace

    bool project_selected(const std::string_view project_name, const CoverageAnalysisOptions& options) {
        if (string_utils::contains_ignore_case(options.excluded_projects, project_name)) {
            return false;
        }
        return options.included_projects.empty() ||
               string_utils::contains_ignore_case(options.included_projects, project_name);
    }

    UncoveredCodeResult find_uncovered(const CoverageAnalysisResult& result, const CoverageAnalysisOptions& options) {
        UncoveredCodeResult out;
        out.success = true;

        std::vector<const ProjectCoverage*> projects;
        for (const auto& project : result.projects) {
            if (project_selected(project.name, options)) {
                projects.push_back(&project);
            }
        }
        std::ranges::sort(projects, {}, [](const ProjectCoverage* p) { return p->name; });

        for (const auto* project : projects) {
            const auto methods_begin = out.uncovered_methods.size();
            const auto lines_begin = out.uncovered_lines.size();
            const auto branches_begin = out.uncovered_branches.size();

            for (const auto& cls : project->classes) {
                collect_class(cls, options, out);
            }

            std::stable_sort(out.uncovered_methods.begin() + static_cast<std::ptrdiff_t>(methods_begin),
                             out.uncovered_methods.end(), [](const UncoveredMethod& a, const UncoveredMethod& b) {
                                 return std::tie(a.file_path, a.start_line) < std::tie(b.file_path, b.start_line);
                             });
            std::stable_sort(out.uncovered_lines.begin() + static_cast<std::ptrdiff_t>(lines_begin),
                             out.uncovered_lines.end(), [](const UncoveredLine& a, const UncoveredLine& b) {
                                 return std::tie(a.file_path, a.line_number) < std::tie(b.file_path, b.line_number);
                             });
            std::stable_sort(out.uncovered_branches.begin() + static_cast<std::ptrdiff_t>(branches_begin),
                             out.uncovered_branches.end(), [](const UncoveredBranch& a, const UncoveredBranch& b) {
                                 return std::tie(a.file_path, a.line_number, a.branch_number) <
                                        std::tie(b.file_path, b.line_number, b.branch_number);
                             });
        }

        return out;
    }

}  // namespace cova::analysis
