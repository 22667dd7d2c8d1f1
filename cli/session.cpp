//
// Created by gregorian-rayne on 1/16/26.
//

#include "cova/cli/session.hpp"
#include "cova/cli/formatter.hpp"
#include "cova/core/logging.hpp"
#include "cova/runner/test_driver.hpp"
#include "cova/serialization.hpp"
#include "cova/utils/file_utils.hpp"

#include <redlog.hpp>

#include <csignal>

namespace cova::cli
{
    namespace {

        auto log_ = redlog::get_logger("cova.cli.session");

        runner::CancellationToken g_interrupt_token;

        void handle_interrupt(const int sig) {
            g_interrupt_token.cancel();
            std::signal(sig, SIG_DFL);
        }

        void append_list(std::vector<std::string>& target, const ParsedArgs& args, const std::string& name) {
            for (auto& item : args.get_list(name)) {
                target.push_back(std::move(item));
            }
        }

        fs::path resolve_against(const fs::path& base, const std::string& configured) {
            const fs::path path(configured);
            return path.is_relative() ? base / path : path;
        }

    }  // namespace

    std::vector<ArgDef> session_arguments() {
        return {
            {"config", 'c', "Configuration file (default: cova.toml found upwards)", false, true, "", "FILE"},
            {"workspace", 'w', "Solution, project file or directory to analyze", false, true, "", "PATH"}
        };
    }

    std::vector<ArgDef> analysis_arguments() {
        return {
            {"options", 0, "Analysis options as a JSON file", false, true, "", "FILE"},
            {"include-project", 0, "Only report these projects (comma-separated)", false, true, "", "NAMES", true},
            {"exclude-project", 0, "Never report these projects (comma-separated)", false, true, "", "NAMES", true},
            {"include-test-project", 0, "Only run these test projects (comma-separated)", false, true, "", "NAMES", true},
            {"exclude-test-project", 0, "Never run these test projects (comma-separated)", false, true, "", "NAMES", true},
            {"exclude-file", 0, "Skip files matching these globs or path suffixes", false, true, "", "PATTERNS", true},
            {"filter", 'f', "Test filter expression passed to the test tool", false, true, "", "EXPR"},
            {"timeout", 't', "Per-project timeout in minutes", false, true, "", "MINUTES"},
            {"sequential", 0, "Run test projects one at a time", false, false, "", ""},
            {"no-branches", 0, "Do not collect branch coverage", false, false, "", ""},
            {"no-methods", 0, "Do not collect method coverage", false, false, "", ""},
            {"include-generated", 0, "Keep generated code in the report", false, false, "", ""}
        };
    }

    Result<CoverageAnalysisOptions, Error> build_options(const core::Config& config, const ParsedArgs& args) {
        CoverageAnalysisOptions options = config.analysis;

        if (const auto file = args.get("options")) {
            auto content = file_utils::read_file(*file);
            if (content.is_err()) {
                return Result<CoverageAnalysisOptions, Error>::failure(content.error());
            }
            auto parsed = serialization::options_from_string(content.value());
            if (parsed.is_err()) {
                return Result<CoverageAnalysisOptions, Error>::failure(parsed.error().with_context(*file));
            }
            options = std::move(parsed.value());
        }

        append_list(options.included_projects, args, "include-project");
        append_list(options.excluded_projects, args, "exclude-project");
        append_list(options.included_test_projects, args, "include-test-project");
        append_list(options.excluded_test_projects, args, "exclude-test-project");
        append_list(options.excluded_files, args, "exclude-file");

        if (const auto filter = args.get("filter")) {
            options.test_filter = *filter;
        }
        if (args.has("timeout")) {
            const auto minutes = args.get_int("timeout");
            if (!minutes) {
                return Result<CoverageAnalysisOptions, Error>::failure(
                    Error::invalid_argument("--timeout expects a whole number of minutes"));
            }
            options.timeout_minutes = *minutes;
        }
        if (args.get_flag("sequential")) options.run_in_parallel = false;
        if (args.get_flag("no-branches")) options.collect_branch_coverage = false;
        if (args.get_flag("no-methods")) options.collect_method_coverage = false;
        if (args.get_flag("include-generated")) options.include_generated_code = true;
        if (args.get_flag("json")) options.output_format = "json";

        if (auto valid = service::CoverageService::validate_options(options); valid.is_err()) {
            return Result<CoverageAnalysisOptions, Error>::failure(valid.error());
        }
        return Result<CoverageAnalysisOptions, Error>::success(std::move(options));
    }

    Result<core::Config, Error> load_session_config(const ParsedArgs& args) {
        fs::path config_path;
        if (const auto explicit_path = args.get("config")) {
            config_path = *explicit_path;
        } else {
            config_path = core::find_config_file(fs::current_path());
        }

        core::Config config = core::Config::default_config();
        if (!config_path.empty()) {
            auto loaded = core::Config::load_from_file(config_path);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded.value());
            if (!config.workspace.empty()) {
                config.workspace = resolve_against(fs::absolute(config_path).parent_path(), config.workspace).string();
            }
        }

        std::string level = config.logging.level;
        if (args.get_flag("quiet")) {
            level = "error";
        } else if (args.get_flag("verbose")) {
            level = "debug";
        }
        if (auto applied = core::configure_logging(level); applied.is_err()) {
            return Result<core::Config, Error>::failure(applied.error());
        }

        set_coverage_thresholds({config.report.good_threshold, config.report.acceptable_threshold});
        if (!config.report.color) {
            colors::set_enabled(false);
        }

        if (!config_path.empty()) {
            log_.dbg("configuration loaded", redlog::field("path", config_path.string()));
        }
        return Result<core::Config, Error>::success(std::move(config));
    }

    fs::path resolve_workspace_path(const core::Config& config, const ParsedArgs& args) {
        if (const auto ws = args.get("workspace")) {
            return fs::absolute(*ws);
        }
        if (!config.workspace.empty()) {
            return fs::absolute(config.workspace);
        }
        return fs::current_path();
    }

    runner::CancellationToken install_interrupt_handler() {
        std::signal(SIGINT, handle_interrupt);
        std::signal(SIGTERM, handle_interrupt);
        return g_interrupt_token;
    }

    // ============================================================================
    // Session
    // ============================================================================

    Session::Session(core::Config config, std::unique_ptr<service::CoverageService> service)
        : config_(std::move(config))
        , service_(std::move(service))
    {}

    Result<std::unique_ptr<Session>, Error> Session::open(const ParsedArgs& args) {
        using R = Result<std::unique_ptr<Session>, Error>;

        auto config = load_session_config(args);
        if (config.is_err()) {
            return R::failure(config.error());
        }

        auto toolchain = runner::locate_toolchain(config.value().toolchain);
        if (toolchain.is_err()) {
            return R::failure(toolchain.error());
        }

        runner::RunnerSettings settings;
        settings.results_root = config.value().runner.results_dir;
        settings.max_parallel = config.value().runner.max_parallel;
        settings.kill_grace = std::chrono::milliseconds(config.value().runner.kill_grace_ms);

        auto svc = std::make_unique<service::CoverageService>(
            std::make_shared<runner::DotnetTestDriver>(std::move(toolchain.value())), settings);

        const fs::path ws_path = resolve_workspace_path(config.value(), args);
        if (auto loaded = svc->load_workspace(ws_path); loaded.is_err()) {
            return R::failure(loaded.error());
        }

        log_.inf("session ready",
                 redlog::field("workspace", ws_path.string()),
                 redlog::field("projects", svc->current_workspace()->projects.size()));

        return R::success(std::unique_ptr<Session>(new Session(std::move(config.value()), std::move(svc))));
    }

    storage::SnapshotStore Session::snapshot_store() const {
        return storage::SnapshotStore(resolve_against(service_->current_workspace()->root, config_.storage.snapshot_dir));
    }

    Result<storage::SnapshotStore, Error> open_snapshot_store(const ParsedArgs& args) {
        auto config = load_session_config(args);
        if (config.is_err()) {
            return Result<storage::SnapshotStore, Error>::failure(config.error());
        }

        fs::path base = resolve_workspace_path(config.value(), args);
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            base = base.parent_path();
        }
        return Result<storage::SnapshotStore, Error>::success(
            storage::SnapshotStore(resolve_against(base, config.value().storage.snapshot_dir)));
    }

}  // namespace cova::cli
