//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef COVA_SERIALIZATION_HPP
#define COVA_SERIALIZATION_HPP

/**
 * @file serialization.hpp
 * @brief JSON forms of options and results.
 *
 * Durations are written as fractional milliseconds and timestamps as
 * ISO 8601 UTC. Deserializers accept missing keys and fall back to the
 * field defaults; keys of the wrong type are reported as parse errors.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"
#include "cova/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace cova::serialization {

    [[nodiscard]] std::string format_timestamp(Timestamp ts);
    [[nodiscard]] std::optional<Timestamp> parse_timestamp(const std::string& text);

    [[nodiscard]] nlohmann::json serialize(const CoverageAnalysisOptions& options);
    [[nodiscard]] nlohmann::json serialize(const CoverageSummary& summary);
    [[nodiscard]] nlohmann::json serialize(const TestExecutionSummary& summary);
    [[nodiscard]] nlohmann::json serialize(const MethodCoverage& method);
    [[nodiscard]] nlohmann::json serialize(const ProjectCoverage& project);
    [[nodiscard]] nlohmann::json serialize(const CoverageAnalysisResult& result);
    [[nodiscard]] nlohmann::json serialize(const CoverageSummaryResult& result);
    [[nodiscard]] nlohmann::json serialize(const UncoveredCodeResult& result);
    [[nodiscard]] nlohmann::json serialize(const MethodCoverageResult& result);
    [[nodiscard]] nlohmann::json serialize(const CoverageComparisonResult& result);

    [[nodiscard]] Result<CoverageAnalysisOptions, Error> deserialize_options(const nlohmann::json& j);
    [[nodiscard]] Result<CoverageSummary, Error> deserialize_summary(const nlohmann::json& j);
    [[nodiscard]] Result<CoverageAnalysisResult, Error> deserialize_analysis(const nlohmann::json& j);

    /**
     * Parses option JSON text, as accepted by the command line.
     */
    [[nodiscard]] Result<CoverageAnalysisOptions, Error> options_from_string(const std::string& text);

}  // namespace cova::serialization

#endif //COVA_SERIALIZATION_HPP
