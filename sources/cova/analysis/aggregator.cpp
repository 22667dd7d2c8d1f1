//
// Created by gregorian-rayne on 1/12/26.
//

#include "cova/analysis/aggregator.hpp"
#include "cova/utils/path_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace cova::analysis {

    namespace {

        void add_counts(CoverageSummary& into, const CoverageSummary& from) noexcept {
            into.total_lines += from.total_lines;
            into.covered_lines += from.covered_lines;
            into.total_branches += from.total_branches;
            into.covered_branches += from.covered_branches;
            into.total_methods += from.total_methods;
            into.covered_methods += from.covered_methods;
            into.total_classes += from.total_classes;
            into.covered_classes += from.covered_classes;
        }

        /**
         * Merges @p from into @p into by line number. Hits are combined
         * with @p combine.
         */
        template<typename Combine>
        void merge_lines(std::vector<LineCoverage>& into, const std::vector<LineCoverage>& from, Combine combine) {
            std::map<int, LineCoverage> by_number;
            for (const auto& line : into) {
                by_number.emplace(line.line_number, line);
            }
            for (const auto& line : from) {
                auto [it, inserted] = by_number.emplace(line.line_number, line);
                if (!inserted) {
                    it->second.hit_count = combine(it->second.hit_count, line.hit_count);
                    if (it->second.source_code.empty()) {
                        it->second.source_code = line.source_code;
                    }
                }
            }

            into.clear();
            into.reserve(by_number.size());
            for (auto& [number, line] : by_number) {
                line.status = line.hit_count > 0 ? CoverageStatus::Covered : CoverageStatus::Uncovered;
                into.push_back(std::move(line));
            }
        }

        template<typename Combine>
        void merge_branches(std::vector<BranchCoverage>& into, const std::vector<BranchCoverage>& from, Combine combine) {
            std::map<std::pair<int, int>, BranchCoverage> by_key;
            for (const auto& branch : into) {
                by_key.emplace(std::make_pair(branch.line_number, branch.branch_number), branch);
            }
            for (const auto& branch : from) {
                auto [it, inserted] = by_key.emplace(std::make_pair(branch.line_number, branch.branch_number), branch);
                if (!inserted) {
                    it->second.hit_count = combine(it->second.hit_count, branch.hit_count);
                }
            }

            into.clear();
            into.reserve(by_key.size());
            for (auto& [key, branch] : by_key) {
                into.push_back(std::move(branch));
            }
        }

        int saturating_add(const int a, const int b) noexcept {
            const long long sum = static_cast<long long>(a) + b;
            return sum > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : static_cast<int>(sum);
        }

        int max_of(const int a, const int b) noexcept {
            return std::max(a, b);
        }

        void recount_lines(CoverageSummary& summary, const std::vector<LineCoverage>& lines,
                           const std::vector<BranchCoverage>& branches) {
            summary.total_lines = static_cast<int>(lines.size());
            summary.covered_lines = static_cast<int>(std::ranges::count_if(lines, [](const LineCoverage& l) {
                return l.hit_count > 0;
            }));
            summary.uncovered_lines = summary.total_lines - summary.covered_lines;

            summary.total_branches = static_cast<int>(branches.size());
            summary.covered_branches = static_cast<int>(std::ranges::count_if(branches, [](const BranchCoverage& b) {
                return b.hit_count > 0;
            }));
            summary.uncovered_branches = summary.total_branches - summary.covered_branches;
        }

        void merge_method(MethodCoverage& into, const MethodCoverage& from) {
            merge_lines(into.lines, from.lines, saturating_add);
            merge_branches(into.branches, from.branches, saturating_add);
            const double lines_pct = std::max(into.summary.lines_covered_percentage, from.summary.lines_covered_percentage);
            const double branch_pct = std::max(into.summary.branches_covered_percentage, from.summary.branches_covered_percentage);
            recount_lines(into.summary, into.lines, into.branches);
            into.summary.lines_covered_percentage = lines_pct;
            into.summary.branches_covered_percentage = branch_pct;
            into.summary.covered_methods = lines_pct > 0.0 ? 1 : 0;
            into.summary.uncovered_methods = into.summary.total_methods - into.summary.covered_methods;
            into.summary.methods_covered_percentage = percentage(into.summary.covered_methods, into.summary.total_methods);
            if (!into.lines.empty()) {
                into.start_line = into.lines.front().line_number;
                into.end_line = into.lines.back().line_number;
            }
        }

        void merge_class(ClassCoverage& into, const ClassCoverage& from) {
            merge_lines(into.lines, from.lines, saturating_add);
            merge_branches(into.branches, from.branches, saturating_add);

            for (const auto& method : from.methods) {
                const auto it = std::ranges::find_if(into.methods, [&method](const MethodCoverage& m) {
                    return m.identifier() == method.identifier();
                });
                if (it == into.methods.end()) {
                    into.methods.push_back(method);
                } else {
                    merge_method(*it, method);
                }
            }

            const double lines_pct = std::max(into.summary.lines_covered_percentage, from.summary.lines_covered_percentage);
            const double branch_pct = std::max(into.summary.branches_covered_percentage, from.summary.branches_covered_percentage);
            recount_lines(into.summary, into.lines, into.branches);
            into.summary.lines_covered_percentage = lines_pct;
            into.summary.branches_covered_percentage = branch_pct;

            into.summary.total_methods = static_cast<int>(into.methods.size());
            into.summary.covered_methods = static_cast<int>(std::ranges::count_if(into.methods, [](const MethodCoverage& m) {
                return m.summary.lines_covered_percentage > 0.0;
            }));
            into.summary.uncovered_methods = into.summary.total_methods - into.summary.covered_methods;
            into.summary.methods_covered_percentage = percentage(into.summary.covered_methods, into.summary.total_methods);

            into.summary.total_classes = 1;
            into.summary.covered_classes = lines_pct > 0.0 ? 1 : 0;
            into.summary.uncovered_classes = 1 - into.summary.covered_classes;
            into.summary.classes_covered_percentage = into.summary.covered_classes > 0 ? 100.0 : 0.0;
        }

    }  // namespace

    double round_percentage(const double value) noexcept {
        if (!std::isfinite(value)) {
            return 0.0;
        }
        return std::round(value * 100.0) / 100.0;
    }

    double percentage(const int covered, const int total) noexcept {
        if (total <= 0) {
            return 0.0;
        }
        return round_percentage(static_cast<double>(covered) / static_cast<double>(total) * 100.0);
    }

    void finalize_summary(CoverageSummary& summary) noexcept {
        summary.uncovered_lines = summary.total_lines - summary.covered_lines;
        summary.uncovered_branches = summary.total_branches - summary.covered_branches;
        summary.uncovered_methods = summary.total_methods - summary.covered_methods;
        summary.uncovered_classes = summary.total_classes - summary.covered_classes;

        summary.lines_covered_percentage = percentage(summary.covered_lines, summary.total_lines);
        summary.branches_covered_percentage = percentage(summary.covered_branches, summary.total_branches);
        summary.methods_covered_percentage = percentage(summary.covered_methods, summary.total_methods);
        summary.classes_covered_percentage = percentage(summary.covered_classes, summary.total_classes);
    }

    std::vector<FileCoverage> build_file_coverage(const std::vector<ClassCoverage>& classes) {
        std::map<std::string, FileCoverage> by_path;
        std::map<std::string, std::vector<BranchCoverage>> branches_by_path;
        std::map<std::string, std::pair<int, int>> classes_by_path;

        for (const auto& cls : classes) {
            const auto key = path_utils::normalize_report_path(cls.file_path);
            auto& file = by_path[key];
            if (file.file_path.empty()) {
                file.file_path = key;
                file.file_name = fs::path(key).filename().string();
            }

            merge_lines(file.lines, cls.lines, max_of);
            merge_branches(branches_by_path[key], cls.branches, max_of);
            file.methods.insert(file.methods.end(), cls.methods.begin(), cls.methods.end());

            auto& [total, covered] = classes_by_path[key];
            total += 1;
            covered += cls.summary.lines_covered_percentage > 0.0 ? 1 : 0;
        }

        std::vector<FileCoverage> files;
        files.reserve(by_path.size());

        for (auto& [key, file] : by_path) {
            auto& summary = file.summary;
            summary = CoverageSummary{};
            recount_lines(summary, file.lines, branches_by_path[key]);

            summary.total_methods = static_cast<int>(file.methods.size());
            summary.covered_methods = static_cast<int>(std::ranges::count_if(file.methods, [](const MethodCoverage& m) {
                return m.summary.lines_covered_percentage > 0.0;
            }));

            summary.total_classes = classes_by_path[key].first;
            summary.covered_classes = classes_by_path[key].second;

            finalize_summary(summary);
            files.push_back(std::move(file));
        }

        return files;
    }

    void absorb_nested_class(ClassCoverage& owner, const ClassCoverage& nested) {
        merge_lines(owner.lines, nested.lines, max_of);
        merge_branches(owner.branches, nested.branches, max_of);

        for (auto method : nested.methods) {
            method.class_name = owner.name;
            const auto it = std::ranges::find_if(owner.methods, [&method](const MethodCoverage& m) {
                return m.identifier() == method.identifier();
            });
            if (it == owner.methods.end()) {
                owner.methods.push_back(std::move(method));
                continue;
            }
            merge_lines(it->lines, method.lines, max_of);
            merge_branches(it->branches, method.branches, max_of);
            recount_lines(it->summary, it->lines, it->branches);
            it->summary.total_methods = 1;
            it->summary.covered_methods = it->summary.covered_lines > 0 ? 1 : 0;
            finalize_summary(it->summary);
            if (!it->lines.empty()) {
                it->start_line = it->lines.front().line_number;
                it->end_line = it->lines.back().line_number;
            }
        }

        auto& summary = owner.summary;
        summary = CoverageSummary{};
        recount_lines(summary, owner.lines, owner.branches);
        summary.total_methods = static_cast<int>(owner.methods.size());
        summary.covered_methods = static_cast<int>(std::ranges::count_if(owner.methods, [](const MethodCoverage& m) {
            return m.summary.lines_covered_percentage > 0.0;
        }));
        summary.total_classes = 1;
        summary.covered_classes = summary.covered_lines > 0 ? 1 : 0;
        finalize_summary(summary);
    }

    void summarize_project(ProjectCoverage& project) {
        project.files = build_file_coverage(project.classes);

        CoverageSummary summary;
        for (const auto& file : project.files) {
            add_counts(summary, file.summary);
        }
        finalize_summary(summary);
        project.summary = summary;
    }

    std::vector<ProjectCoverage> merge_projects(std::vector<ProjectCoverage> projects) {
        std::vector<ProjectCoverage> merged;
        std::map<std::string, std::size_t> index_by_name;

        for (auto& project : projects) {
            const auto [it, inserted] = index_by_name.emplace(project.name, merged.size());
            if (inserted) {
                merged.push_back(std::move(project));
                continue;
            }

            auto& target = merged[it->second];
            for (const auto& cls : project.classes) {
                const auto existing = std::ranges::find_if(target.classes, [&cls](const ClassCoverage& c) {
                    return c.name == cls.name &&
                           path_utils::normalize_report_path(c.file_path) == path_utils::normalize_report_path(cls.file_path);
                });
                if (existing == target.classes.end()) {
                    target.classes.push_back(cls);
                } else {
                    merge_class(*existing, cls);
                }
            }
            summarize_project(target);
        }

        return merged;
    }

    void calculate_overall_summary(CoverageAnalysisResult& result) {
        CoverageSummary summary;
        for (const auto& project : result.projects) {
            add_counts(summary, project.summary);
        }
        finalize_summary(summary);
        result.summary = summary;
    }

}  // namespace cova::analysis
