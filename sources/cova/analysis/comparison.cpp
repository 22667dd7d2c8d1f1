//
// Created by gregorian-rayne on 1/13/26.
//

#include "cova/analysis/comparison.hpp"
#include "cova/analysis/aggregator.hpp"
#include "cova/utils/path_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <iterator>
#include <ranges>
#include <set>

namespace cova::analysis {

    namespace {

        struct LineCounts {
            int total = 0;
            int covered = 0;
        };

        /**
         * Line counts per normalized file path, summed across projects.
         */
        std::map<std::string, LineCounts> file_counts(const CoverageAnalysisResult& result) {
            std::map<std::string, LineCounts> counts;
            for (const auto& project : result.projects) {
                for (const auto& file : project.files) {
                    auto& entry = counts[path_utils::normalize_report_path(file.file_path)];
                    entry.total += file.summary.total_lines;
                    entry.covered += file.summary.covered_lines;
                }
            }
            return counts;
        }

        std::set<std::string> zero_coverage_methods(const CoverageAnalysisResult& result) {
            std::set<std::string> ids;
            for (const auto& project : result.projects) {
                for (const auto& cls : project.classes) {
                    for (const auto& method : cls.methods) {
                        if (method.is_uncovered()) {
                            ids.insert(method.identifier());
                        }
                    }
                }
            }
            return ids;
        }

        std::set<std::string> all_methods(const CoverageAnalysisResult& result) {
            std::set<std::string> ids;
            for (const auto& project : result.projects) {
                for (const auto& cls : project.classes) {
                    for (const auto& method : cls.methods) {
                        ids.insert(method.identifier());
                    }
                }
            }
            return ids;
        }

        bool consistent(const CoverageSummary& s) noexcept {
            const auto ok = [](const int total, const int covered) {
                return total >= 0 && covered >= 0 && covered <= total;
            };
            return ok(s.total_lines, s.covered_lines) && ok(s.total_branches, s.covered_branches) &&
                   ok(s.total_methods, s.covered_methods) && ok(s.total_classes, s.covered_classes) &&
                   std::isfinite(s.lines_covered_percentage) && std::isfinite(s.branches_covered_percentage) &&
                   std::isfinite(s.methods_covered_percentage) && std::isfinite(s.classes_covered_percentage);
        }

    }  // namespace

    Result<void, Error> validate_baseline(const CoverageAnalysisResult& baseline) {
        if (!baseline.success) {
            return Result<void, Error>::failure(Error::comparison_error(
                "Baseline analysis was not successful: " + baseline.error_message.value_or("no details recorded")
            ));
        }
        if (!consistent(baseline.summary)) {
            return Result<void, Error>::failure(Error::comparison_error("Baseline summary is inconsistent"));
        }
        for (const auto& project : baseline.projects) {
            if (!consistent(project.summary)) {
                return Result<void, Error>::failure(
                    Error::comparison_error("Baseline project '" + project.name + "' has an inconsistent summary")
                );
            }
        }
        return Result<void, Error>::success();
    }

    CoverageComparisonResult compare_results(
        const CoverageAnalysisResult& baseline,
        const CoverageAnalysisResult& current,
        const double file_threshold
    ) {
        CoverageComparisonResult result;
        result.success = true;
        result.baseline = baseline.summary;
        result.current = current.summary;

        auto& delta = result.delta;
        const auto& b = baseline.summary;
        const auto& c = current.summary;
        delta.lines_coverage_change = round_percentage(c.lines_covered_percentage - b.lines_covered_percentage);
        delta.branches_coverage_change = round_percentage(c.branches_covered_percentage - b.branches_covered_percentage);
        delta.methods_coverage_change = round_percentage(c.methods_covered_percentage - b.methods_covered_percentage);
        delta.classes_coverage_change = round_percentage(c.classes_covered_percentage - b.classes_covered_percentage);
        delta.lines_change = c.covered_lines - b.covered_lines;
        delta.branches_change = c.covered_branches - b.covered_branches;
        delta.methods_change = c.covered_methods - b.covered_methods;
        delta.classes_change = c.covered_classes - b.covered_classes;

        const auto old_files = file_counts(baseline);
        const auto new_files = file_counts(current);

        for (const auto& [path, old_counts] : old_files) {
            const auto it = new_files.find(path);
            if (it == new_files.end()) {
                result.removed_files.push_back(path);
                continue;
            }

            FileCoverageChange change;
            change.file_path = path;
            change.baseline_percentage = percentage(old_counts.covered, old_counts.total);
            change.current_percentage = percentage(it->second.covered, it->second.total);

            if (change.change() > file_threshold) {
                result.improved_files.push_back(change);
            } else if (change.change() < -file_threshold) {
                result.regressed_files.push_back(change);
            }
        }

        for (const auto& path : new_files | std::views::keys) {
            if (!old_files.contains(path)) {
                result.added_files.push_back(path);
            }
        }

        auto by_magnitude = [](const FileCoverageChange& x, const FileCoverageChange& y) {
            return std::abs(x.change()) > std::abs(y.change());
        };
        std::ranges::stable_sort(result.improved_files, by_magnitude);
        std::ranges::stable_sort(result.regressed_files, by_magnitude);

        const auto old_zero = zero_coverage_methods(baseline);
        const auto new_zero = zero_coverage_methods(current);
        const auto current_methods = all_methods(current);

        std::ranges::set_difference(new_zero, old_zero, std::back_inserter(result.newly_uncovered_methods));
        for (const auto& id : old_zero) {
            if (!new_zero.contains(id) && current_methods.contains(id)) {
                result.newly_covered_methods.push_back(id);
            }
        }

        return result;
    }

}  // namespace cova::analysis
