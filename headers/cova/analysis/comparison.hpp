//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef COVA_COMPARISON_HPP
#define COVA_COMPARISON_HPP

/**
 * @file comparison.hpp
 * @brief Differences between two coverage snapshots.
 *
 * Deltas are current - baseline. Files are matched by normalized path;
 * files found on one side only are listed as added or removed. Method
 * lists are the set differences of zero-coverage method identifiers.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"
#include "cova/types.hpp"

namespace cova::analysis {

    /// File line-coverage changes at or below this many points are ignored.
    inline constexpr double kFileChangeThreshold = 0.1;

    /**
     * Checks that a snapshot can serve as a baseline: it must have
     * succeeded and its summary counts must be consistent.
     */
    [[nodiscard]] Result<void, Error> validate_baseline(const CoverageAnalysisResult& baseline);

    /**
     * Computes the delta report. Always succeeds on valid inputs; callers
     * check the baseline with validate_baseline() first.
     */
    [[nodiscard]] CoverageComparisonResult compare_results(
        const CoverageAnalysisResult& baseline,
        const CoverageAnalysisResult& current,
        double file_threshold = kFileChangeThreshold
    );

}  // namespace cova::analysis

#endif //COVA_COMPARISON_HPP
