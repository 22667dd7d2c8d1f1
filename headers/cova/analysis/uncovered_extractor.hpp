//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef COVA_UNCOVERED_EXTRACTOR_HPP
#define COVA_UNCOVERED_EXTRACTOR_HPP

/**
 * @file uncovered_extractor.hpp
 * @brief Flattens a coverage tree into lists of code no test reached.
 */

#include "cova/types.hpp"

#include <string_view>

namespace cova::analysis {

    /**
     * True when the project passes the included/excluded project filters.
     * An empty include list admits every project not excluded.
     */
    [[nodiscard]] bool project_selected(std::string_view project_name, const CoverageAnalysisOptions& options);

    /**
     * Collects uncovered methods (line coverage exactly 0), lines
     * (hit count 0) and branch outcomes (hit count 0).
     *
     * Records are ordered by project, then file, then line. Branches are
     * only reported when options.collect_branch_coverage is set, and
     * methods only when options.collect_method_coverage is set.
     */
    [[nodiscard]] UncoveredCodeResult find_uncovered(const CoverageAnalysisResult& result,
                                                     const CoverageAnalysisOptions& options);

}  // namespace cova::analysis

#endif //COVA_UNCOVERED_EXTRACTOR_HPP
