//
// Created by gregorian-rayne on 1/16/26.
//

#include "cova/cli/commands/command.hpp"
#include "cova/cli/formatter.hpp"
#include "cova/cli/session.hpp"

#include "cova/discovery/project_discovery.hpp"
#include "cova/workspace/workspace.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>

namespace cova::cli
{
    /**
     * Shows how each workspace project was classified and which test
     * projects a run would select. Runs no tests.
     */
    class ProjectsCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "projects";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List workspace projects and the test projects a run would use";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = session_arguments();
            auto analysis = analysis_arguments();
            defs.insert(defs.end(), analysis.begin(), analysis.end());
            return defs;
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }
            apply_common_flags(args);

            auto config = load_session_config(args);
            if (config.is_err()) {
                print_error(config.error().message());
                return 1;
            }
            auto options = build_options(config.value(), args);
            if (options.is_err()) {
                print_error(options.error().message());
                return 1;
            }

            auto ws = workspace::WorkspaceLoader::load(resolve_workspace_path(config.value(), args));
            if (ws.is_err()) {
                print_error(ws.error().message());
                return 1;
            }

            const auto selected = discovery::select_test_projects(ws.value().projects, options.value());
            auto is_selected = [&](const workspace::ProjectInfo& project) {
                return std::ranges::find(selected, project.path) != selected.end();
            };

            if (is_json()) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& project : ws.value().projects) {
                    const auto c = discovery::classify_project(project);
                    out.push_back({
                        {"name", project.name},
                        {"path", project.path.string()},
                        {"is_test_project", c.is_test},
                        {"signal", discovery::to_string(c.signal)},
                        {"evidence", c.evidence},
                        {"selected", is_selected(project)},
                        {"load_error", project.load_error ? nlohmann::json(*project.load_error) : nlohmann::json(nullptr)}
                    });
                }
                std::cout << out.dump(2) << "\n";
                return 0;
            }

            Table table({
                {"Project", 0, false, std::nullopt},
                {"Kind", 0, false, std::nullopt},
                {"Reason", 0, false, std::nullopt},
                {"Run", 0, false, std::nullopt},
                {"Path", 0, false, std::nullopt}
            });

            for (const auto& project : ws.value().projects) {
                if (!project.is_loaded()) {
                    table.add_row({project.name, "unreadable", *project.load_error, "-", format_path(project.path)});
                    continue;
                }
                const auto c = discovery::classify_project(project);
                std::string reason = discovery::to_string(c.signal);
                if (!c.evidence.empty()) {
                    reason += " (" + c.evidence + ")";
                }
                table.add_row({
                    project.name,
                    c.is_test ? "test" : "production",
                    reason,
                    is_selected(project) ? "yes" : "-",
                    format_path(project.path)
                });
            }

            table.render(std::cout);
            print("\n" + std::to_string(selected.size()) + " of " +
                  std::to_string(ws.value().projects.size()) + " projects selected for testing");
            return 0;
        }
    };

    namespace {
        struct ProjectsCommandRegistrar {
            ProjectsCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<ProjectsCommand>());
            }
        } projects_registrar;
    }
}  // namespace cova::cli
