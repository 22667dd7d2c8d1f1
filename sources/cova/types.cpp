//
// Created by gregorian-rayne on 12/28/25.
//

#include "cova/types.hpp"

namespace cova {

    std::optional<CoverageStatus> coverage_status_from_string(const std::string& text) {
        if (text == "NotCoverable") return CoverageStatus::NotCoverable;
        if (text == "Covered") return CoverageStatus::Covered;
        if (text == "Uncovered") return CoverageStatus::Uncovered;
        if (text == "PartiallyCovered") return CoverageStatus::PartiallyCovered;
        return std::nullopt;
    }

    std::optional<BranchType> branch_type_from_string(const std::string& text) {
        if (text == "Conditional") return BranchType::Conditional;
        if (text == "Switch") return BranchType::Switch;
        if (text == "Loop") return BranchType::Loop;
        if (text == "Exception") return BranchType::Exception;
        if (text == "Return") return BranchType::Return;
        return std::nullopt;
    }

}  // namespace cova
