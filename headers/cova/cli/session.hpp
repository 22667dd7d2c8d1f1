//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef COVA_SESSION_HPP
#define COVA_SESSION_HPP

/**
 * @file session.hpp
 * @brief Shared setup for commands that run coverage.
 *
 * A session resolves the configuration (--config, or cova.toml found
 * upwards from the working directory), applies the log level, locates
 * the test tool and loads the workspace named by --workspace, the
 * config, or the working directory, in that order.
 */

#include "cova/cli/commands/command.hpp"
#include "cova/core/config.hpp"
#include "cova/runner/process.hpp"
#include "cova/service/coverage_service.hpp"
#include "cova/storage/snapshot_store.hpp"

#include <memory>
#include <vector>

namespace cova::cli
{
    /**
     * --config and --workspace.
     */
    [[nodiscard]] std::vector<ArgDef> session_arguments();

    /**
     * Flags that override the [analysis] section for one invocation.
     */
    [[nodiscard]] std::vector<ArgDef> analysis_arguments();

    /**
     * Starts from --options FILE (JSON) or the configured defaults and
     * applies the per-invocation flags on top.
     */
    [[nodiscard]] Result<CoverageAnalysisOptions, Error> build_options(
        const core::Config& config,
        const ParsedArgs& args
    );

    /**
     * Loads the configuration and applies its log level. Honors
     * --verbose and --quiet over the configured level.
     */
    [[nodiscard]] Result<core::Config, Error> load_session_config(const ParsedArgs& args);

    /**
     * --workspace, else the configured workspace, else the working
     * directory.
     */
    [[nodiscard]] fs::path resolve_workspace_path(const core::Config& config, const ParsedArgs& args);

    /**
     * Cancels the returned token on the first SIGINT or SIGTERM. A
     * second signal restores the default action.
     */
    [[nodiscard]] runner::CancellationToken install_interrupt_handler();

    class Session {
    public:
        /**
         * Fully initialized session with a loaded workspace.
         */
        static Result<std::unique_ptr<Session>, Error> open(const ParsedArgs& args);

        [[nodiscard]] service::CoverageService& service() { return *service_; }
        [[nodiscard]] const core::Config& config() const { return config_; }

        /**
         * Snapshot directory; relative paths resolve against the
         * workspace root.
         */
        [[nodiscard]] storage::SnapshotStore snapshot_store() const;

    private:
        Session(core::Config config, std::unique_ptr<service::CoverageService> service);

        core::Config config_;
        std::unique_ptr<service::CoverageService> service_;
    };

    /**
     * Snapshot store for commands that do not run tests.
     */
    [[nodiscard]] Result<storage::SnapshotStore, Error> open_snapshot_store(const ParsedArgs& args);

}  // namespace cova::cli

#endif //COVA_SESSION_HPP
