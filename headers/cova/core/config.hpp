//
// Created by gregorian on 15/10/2025.
//

#ifndef COVA_CONFIG_HPP
#define COVA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Project configuration loaded from cova.toml.
 *
 * Example:
 * @code
 *     workspace = "src/App.sln"
 *
 *     [toolchain]
 *     executable = "dotnet"
 *     collector = "XPlat Code Coverage"
 *
 *     [runner]
 *     max_parallel = 4
 *
 *     [analysis]
 *     timeout_minutes = 15
 *     excluded_files = ["*Migrations/*"]
 *
 *     [report]
 *     good_threshold = 90.0
 *
 *     [logging]
 *     level = "debug"
 * @endcode
 */

#include "cova/result.hpp"
#include "cova/error.hpp"
#include "cova/types.hpp"

#include <string>
#include <vector>

namespace cova::core {

    /**
     * External test tool invoked once per test project.
     */
    struct ToolchainConfig {
        std::string executable = "dotnet";
        std::string collector = "XPlat Code Coverage";
        std::string verbosity = "normal";
        std::vector<std::string> extra_args;
        int version_probe_seconds = 30;
    };

    struct RunnerConfig {
        /// Upper bound on concurrently running test processes, 0 = unbounded.
        unsigned int max_parallel = 0;
        /// Relative paths resolve against the workspace root.
        std::string results_dir = ".cova/results";
        int kill_grace_ms = 2000;
    };

    struct StorageConfig {
        std::string snapshot_dir = ".cova/snapshots";
    };

    /**
     * Terminal report presentation. Coverage at or above good_threshold is
     * shown green, at or above acceptable_threshold yellow, red below.
     */
    struct ReportConfig {
        double good_threshold = 80.0;
        double acceptable_threshold = 50.0;
        bool color = true;
    };

    struct LoggingConfig {
        std::string level = "info";
    };

    class Config {
    public:
        Config() = default;

        /// Solution, project file or directory to load when none is given.
        std::string workspace;

        ToolchainConfig toolchain;
        RunnerConfig runner;
        CoverageAnalysisOptions analysis;
        StorageConfig storage;
        ReportConfig report;
        LoggingConfig logging;

        static Result<Config, Error> load_from_file(const fs::path& path);

        static Result<Config, Error> load_from_string(const std::string& content);

        static Config default_config();

        [[nodiscard]] Result<void, Error> save_to_file(const fs::path& path) const;

        /**
         * Serializes the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Checks value ranges. Collects every problem into one message.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

    /**
     * Looks for cova.toml in @p start and its parents.
     *
     * @return Path of the first config found, or empty.
     */
    [[nodiscard]] fs::path find_config_file(const fs::path& start);

}  // namespace cova::core

#endif //COVA_CONFIG_HPP
