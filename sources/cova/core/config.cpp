//
// Created by gregorian on 15/10/2025.
//

#include "cova/core/config.hpp"
#include "cova/core/logging.hpp"
#include "cova/utils/file_utils.hpp"
#include "cova/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <sstream>

namespace cova::core
{
    namespace {

        void read_string_list(const toml::table& table, const char* key, std::vector<std::string>& out) {
            if (const auto* array = table[key].as_array()) {
                out.clear();
                for (const auto& item : *array) {
                    out.emplace_back(item.value_or(""));
                }
            }
        }

        toml::array to_array(const std::vector<std::string>& items) {
            toml::array array;
            for (const auto& item : items) {
                array.push_back(item);
            }
            return array;
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        const auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(
                Error::config_error("Configuration file not readable", path.string()));
        }

        return load_from_string(content.value());
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            config.workspace = tbl["workspace"].value_or(std::string{});

            if (const auto* toolchain = tbl["toolchain"].as_table()) {
                auto& t = *toolchain;
                config.toolchain.executable = t["executable"].value_or(config.toolchain.executable);
                config.toolchain.collector = t["collector"].value_or(config.toolchain.collector);
                config.toolchain.verbosity = t["verbosity"].value_or(config.toolchain.verbosity);
                config.toolchain.version_probe_seconds =
                    t["version_probe_seconds"].value_or(config.toolchain.version_probe_seconds);
                read_string_list(t, "extra_args", config.toolchain.extra_args);
            }

            if (const auto* runner = tbl["runner"].as_table()) {
                auto& r = *runner;
                const auto max_parallel = r["max_parallel"].value_or(static_cast<int64_t>(0));
                if (max_parallel < 0) {
                    return Result<Config, Error>::failure(
                        Error::config_error("runner.max_parallel must not be negative"));
                }
                config.runner.max_parallel = static_cast<unsigned int>(max_parallel);
                config.runner.results_dir = r["results_dir"].value_or(config.runner.results_dir);
                config.runner.kill_grace_ms = r["kill_grace_ms"].value_or(config.runner.kill_grace_ms);
            }

            if (const auto* analysis = tbl["analysis"].as_table()) {
                auto& a = *analysis;
                auto& options = config.analysis;
                options.timeout_minutes = a["timeout_minutes"].value_or(options.timeout_minutes);
                options.run_in_parallel = a["run_in_parallel"].value_or(options.run_in_parallel);
                options.collect_branch_coverage = a["collect_branch_coverage"].value_or(options.collect_branch_coverage);
                options.collect_method_coverage = a["collect_method_coverage"].value_or(options.collect_method_coverage);
                options.include_generated_code = a["include_generated_code"].value_or(options.include_generated_code);
                options.output_format = a["output_format"].value_or(options.output_format);
                if (auto filter = a["test_filter"].value<std::string>()) {
                    options.test_filter = *filter;
                }
                read_string_list(a, "included_projects", options.included_projects);
                read_string_list(a, "excluded_projects", options.excluded_projects);
                read_string_list(a, "included_test_projects", options.included_test_projects);
                read_string_list(a, "excluded_test_projects", options.excluded_test_projects);
                read_string_list(a, "excluded_files", options.excluded_files);
            }

            if (const auto* storage = tbl["storage"].as_table()) {
                config.storage.snapshot_dir = (*storage)["snapshot_dir"].value_or(config.storage.snapshot_dir);
            }

            if (const auto* report = tbl["report"].as_table()) {
                auto& r = config.report;
                r.good_threshold = (*report)["good_threshold"].value_or(r.good_threshold);
                r.acceptable_threshold = (*report)["acceptable_threshold"].value_or(r.acceptable_threshold);
                r.color = (*report)["color"].value_or(r.color);
            }

            if (const auto* logging = tbl["logging"].as_table()) {
                config.logging.level = (*logging)["level"].value_or(config.logging.level);
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config, Error>::failure(validation.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration: " + std::string(err.description())));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::save_to_file(const fs::path& path) const {
        return file_utils::write_file(path, to_string());
    }

    std::string Config::to_string() const {
        toml::table root;
        if (!workspace.empty()) {
            root.insert("workspace", workspace);
        }

        root.insert("toolchain", toml::table{
            {"executable", toolchain.executable},
            {"collector", toolchain.collector},
            {"verbosity", toolchain.verbosity},
            {"extra_args", to_array(toolchain.extra_args)},
            {"version_probe_seconds", toolchain.version_probe_seconds},
        });

        root.insert("runner", toml::table{
            {"max_parallel", static_cast<int64_t>(runner.max_parallel)},
            {"results_dir", runner.results_dir},
            {"kill_grace_ms", runner.kill_grace_ms},
        });

        toml::table analysis_table{
            {"timeout_minutes", analysis.timeout_minutes},
            {"run_in_parallel", analysis.run_in_parallel},
            {"collect_branch_coverage", analysis.collect_branch_coverage},
            {"collect_method_coverage", analysis.collect_method_coverage},
            {"include_generated_code", analysis.include_generated_code},
            {"output_format", analysis.output_format},
            {"included_projects", to_array(analysis.included_projects)},
            {"excluded_projects", to_array(analysis.excluded_projects)},
            {"included_test_projects", to_array(analysis.included_test_projects)},
            {"excluded_test_projects", to_array(analysis.excluded_test_projects)},
            {"excluded_files", to_array(analysis.excluded_files)},
        };
        if (analysis.test_filter) {
            analysis_table.insert("test_filter", *analysis.test_filter);
        }
        root.insert("analysis", std::move(analysis_table));

        root.insert("storage", toml::table{{"snapshot_dir", storage.snapshot_dir}});
        root.insert("report", toml::table{
            {"good_threshold", report.good_threshold},
            {"acceptable_threshold", report.acceptable_threshold},
            {"color", report.color},
        });
        root.insert("logging", toml::table{{"level", logging.level}});

        std::ostringstream ss;
        ss << root << "\n";
        return ss.str();
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (toolchain.executable.empty()) {
            errors.emplace_back("toolchain.executable must not be empty");
        }
        if (toolchain.version_probe_seconds <= 0) {
            errors.emplace_back("toolchain.version_probe_seconds must be positive");
        }
        if (runner.kill_grace_ms < 0) {
            errors.emplace_back("runner.kill_grace_ms must not be negative");
        }
        if (runner.results_dir.empty()) {
            errors.emplace_back("runner.results_dir must not be empty");
        }
        if (analysis.timeout_minutes <= 0) {
            errors.emplace_back("analysis.timeout_minutes must be positive");
        }
        if (storage.snapshot_dir.empty()) {
            errors.emplace_back("storage.snapshot_dir must not be empty");
        }
        if (report.acceptable_threshold < 0.0 || report.good_threshold > 100.0
            || report.acceptable_threshold > report.good_threshold) {
            errors.emplace_back("report thresholds must satisfy 0 <= acceptable_threshold <= good_threshold <= 100");
        }
        if (parse_log_level(logging.level).is_err()) {
            errors.emplace_back("logging.level '" + logging.level + "' is not a known level");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Invalid configuration: " + string_utils::join(errors, "; ")));
        }
        return Result<void, Error>::success();
    }

    fs::path find_config_file(const fs::path& start) {
        std::error_code ec;
        fs::path dir = fs::absolute(start, ec);
        if (ec) {
            return {};
        }
        if (!fs::is_directory(dir, ec)) {
            dir = dir.parent_path();
        }

        while (!dir.empty()) {
            if (const auto candidate = dir / "cova.toml"; fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
            const auto parent = dir.parent_path();
            if (parent == dir) {
                break;
            }
            dir = parent;
        }
        return {};
    }

}  // namespace cova::core
