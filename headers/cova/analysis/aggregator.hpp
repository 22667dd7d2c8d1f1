//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef COVA_AGGREGATOR_HPP
#define COVA_AGGREGATOR_HPP

/**
 * @file aggregator.hpp
 * @brief Bottom-up coverage summaries.
 *
 * Every level above a class is computed from counts, never from averaged
 * percentages: class -> file -> project -> whole run. Percentages are
 * rounded half away from zero to two decimals, and are 0 when the total
 * is 0.
 *
 * Class and method percentages keep the rates the instrumentation tool
 * reported; only their counts come from child lines.
 */

#include "cova/types.hpp"

#include <vector>

namespace cova::analysis {

    [[nodiscard]] double round_percentage(double value) noexcept;

    /**
     * covered / total * 100, rounded. 0 when total <= 0.
     */
    [[nodiscard]] double percentage(int covered, int total) noexcept;

    /**
     * Derives uncovered counts and all four percentages from the counts.
     */
    void finalize_summary(CoverageSummary& summary) noexcept;

    /**
     * Groups classes by normalized source path. Lines from classes that
     * share a file are merged by line number, keeping the highest hit
     * count.
     */
    [[nodiscard]] std::vector<FileCoverage> build_file_coverage(const std::vector<ClassCoverage>& classes);

    /**
     * Rebuilds project.files from project.classes and sums them into
     * project.summary.
     */
    void summarize_project(ProjectCoverage& project);

    /**
     * Moves the lines, branch outcomes and methods of a compiler-generated
     * nested type (state machine, closure) into the class that declared
     * it. A line reported by both keeps the higher hit count, and
     * @p owner's summary is recounted from the merged data.
     */
    void absorb_nested_class(ClassCoverage& owner, const ClassCoverage& nested);

    /**
     * Combines entries that describe the same assembly, as happens when
     * several test projects exercise one production project. Hit counts
     * add up; node rates keep the best reported value.
     */
    [[nodiscard]] std::vector<ProjectCoverage> merge_projects(std::vector<ProjectCoverage> projects);

    /**
     * Sums project counts into result.summary. Touches nothing else, and
     * applying it twice gives the same summary.
     */
    void calculate_overall_summary(CoverageAnalysisResult& result);

}  // namespace cova::analysis

#endif //COVA_AGGREGATOR_HPP
