//
// Created by gregorian-rayne on 1/2/26.
//

#include "cova/cli/commands/command.hpp"
#include "cova/cli/formatter.hpp"
#include "cova/cli/session.hpp"

#include "cova/serialization.hpp"
#include "cova/utils/file_utils.hpp"
#include "cova/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace cova::cli
{
    class SnapshotCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "snapshot";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Manage saved coverage snapshots";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cova snapshot <subcommand> [OPTIONS]\n"
                   "\n"
                   "Subcommands:\n"
                   "  list                        List all snapshots\n"
                   "  save <name> <analysis.json> Save an analysis written by 'cova run --json'\n"
                   "  show <name>                 Show snapshot details\n"
                   "  delete <name>               Delete a snapshot\n"
                   "  baseline [name]             Show or set the baseline snapshot\n"
                   "\n"
                   "Examples:\n"
                   "  cova run --save main\n"
                   "  cova snapshot baseline main\n"
                   "  cova snapshot save nightly nightly.json -d \"Nightly build\"\n"
                   "  cova snapshot baseline --clear";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = session_arguments();
            defs.push_back({"description", 'd', "Description for the snapshot", false, true, "", "TEXT"});
            defs.push_back({"tag", 0, "Comma-separated tags for the snapshot", false, true, "", "TAGS", true});
            defs.push_back({"clear", 0, "Clear the baseline", false, false, "", ""});
            return defs;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No subcommand specified. Use 'cova snapshot list|save|show|delete|baseline'";
            }

            const std::string& subcommand = args.positional()[0];
            if (subcommand != "save" && subcommand != "list" && subcommand != "show" &&
                subcommand != "delete" && subcommand != "baseline") {
                return "Unknown subcommand: " + subcommand;
            }

            if (subcommand == "save" && args.positional().size() < 3) {
                return "Usage: cova snapshot save <name> <analysis.json>";
            }

            if ((subcommand == "show" || subcommand == "delete") && args.positional().size() < 2) {
                return "Usage: cova snapshot " + subcommand + " <name>";
            }

            if (subcommand == "baseline" && args.get_flag("clear") && args.positional().size() > 1) {
                return "--clear does not take a snapshot name";
            }

            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }
            apply_common_flags(args);

            auto store = open_snapshot_store(args);
            if (store.is_err()) {
                print_error(store.error().message());
                return 1;
            }

            const std::string& subcommand = args.positional()[0];
            if (subcommand == "list") {
                return list_snapshots(store.value());
            }
            if (subcommand == "save") {
                return save_snapshot(store.value(), args.positional()[1], args.positional()[2], args);
            }
            if (subcommand == "show") {
                return show_snapshot(store.value(), args.positional()[1]);
            }
            if (subcommand == "delete") {
                return delete_snapshot(store.value(), args.positional()[1]);
            }
            return baseline(store.value(), args);
        }

    private:
        [[nodiscard]] int list_snapshots(const storage::SnapshotStore& store) const {
            auto result = store.list();
            if (result.is_err()) {
                print_error("Failed to list snapshots: " + result.error().message());
                return 1;
            }

            const auto& snapshots = result.value();
            const auto baseline = store.get_baseline();

            if (is_json()) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& s : snapshots) {
                    out.push_back({
                        {"name", s.name},
                        {"description", s.description},
                        {"created_at", serialization::format_timestamp(s.created_at)},
                        {"tags", s.tags},
                        {"project_count", s.project_count},
                        {"lines_covered_percentage", s.lines_covered_percentage},
                        {"branches_covered_percentage", s.branches_covered_percentage},
                        {"is_baseline", baseline && *baseline == s.name}
                    });
                }
                std::cout << out.dump(2) << "\n";
                return 0;
            }

            if (snapshots.empty()) {
                print("No snapshots found.");
                print("Create one with: cova run --save <name>");
                return 0;
            }

            Table table({
                {"Name", 0, false, std::nullopt},
                {"Created", 0, false, std::nullopt},
                {"Projects", 0, true, std::nullopt},
                {"Line %", 0, true, std::nullopt},
                {"Branch %", 0, true, std::nullopt},
                {"Description", 0, false, std::nullopt}
            });

            for (const auto& s : snapshots) {
                std::string snap_name = s.name;
                if (baseline && *baseline == s.name) {
                    snap_name += " *";
                }
                table.add_row({
                    snap_name,
                    format_timestamp(s.created_at),
                    std::to_string(s.project_count),
                    format_percent(s.lines_covered_percentage),
                    format_percent(s.branches_covered_percentage),
                    s.description.empty() ? "-" : s.description
                });
            }

            table.render(std::cout);

            if (baseline) {
                std::cout << "\n* = baseline\n";
            }
            return 0;
        }

        [[nodiscard]] int save_snapshot(const storage::SnapshotStore& store,
                                        const std::string& snap_name,
                                        const fs::path& analysis_file,
                                        const ParsedArgs& args) const {
            auto content = file_utils::read_file(analysis_file);
            if (content.is_err()) {
                print_error(content.error().to_string());
                return 1;
            }

            const nlohmann::json j = nlohmann::json::parse(content.value(), nullptr, false);
            if (j.is_discarded()) {
                print_error("Not a JSON file: " + analysis_file.string());
                return 1;
            }
            auto analysis = serialization::deserialize_analysis(j);
            if (analysis.is_err()) {
                print_error(analysis.error().to_string());
                return 1;
            }

            const auto tags = args.get_list("tag");

            if (auto saved = store.save(snap_name, analysis.value(), args.get_or("description", ""), tags); saved.is_err()) {
                print_error("Failed to save snapshot: " + saved.error().message());
                return 1;
            }

            print("Snapshot saved: " + snap_name);
            return 0;
        }

        [[nodiscard]] int show_snapshot(const storage::SnapshotStore& store, const std::string& snap_name) const {
            auto result = store.load(snap_name);
            if (result.is_err()) {
                print_error("Failed to load snapshot: " + result.error().message());
                return 1;
            }

            const auto& [metadata, analysis] = result.value();

            if (is_json()) {
                nlohmann::json out = serialization::serialize(analysis);
                out["snapshot"] = {
                    {"name", metadata.name},
                    {"description", metadata.description},
                    {"created_at", serialization::format_timestamp(metadata.created_at)},
                    {"tags", metadata.tags}
                };
                std::cout << out.dump(2) << "\n";
                return 0;
            }

            std::cout << bold("Snapshot: " + metadata.name) << "\n";
            std::cout << std::string(60, '=') << "\n\n";
            std::cout << "Created:     " << format_timestamp(metadata.created_at) << "\n";
            if (!metadata.description.empty()) {
                std::cout << "Description: " << metadata.description << "\n";
            }
            if (!metadata.tags.empty()) {
                std::cout << "Tags:        " << string_utils::join(metadata.tags, ", ") << "\n";
            }
            std::cout << "Analyzed:    " << format_timestamp(analysis.analysis_time)
                      << " (" << format_duration(analysis.execution_duration) << ")\n";

            const SummaryPrinter printer(std::cout);
            printer.print_summary(analysis.summary);
            printer.print_projects(analysis.projects);
            return 0;
        }

        [[nodiscard]] int delete_snapshot(const storage::SnapshotStore& store, const std::string& snap_name) const {
            if (auto result = store.remove(snap_name); result.is_err()) {
                print_error("Failed to delete snapshot: " + result.error().message());
                return 1;
            }

            print("Snapshot deleted: " + snap_name);
            return 0;
        }

        [[nodiscard]] int baseline(const storage::SnapshotStore& store, const ParsedArgs& args) const {
            if (args.get_flag("clear")) {
                if (auto result = store.clear_baseline(); result.is_err()) {
                    print_error("Failed to clear baseline: " + result.error().message());
                    return 1;
                }
                print("Baseline cleared");
                return 0;
            }

            if (args.positional().size() > 1) {
                const std::string& snap_name = args.positional()[1];
                if (auto result = store.set_baseline(snap_name); result.is_err()) {
                    print_error("Failed to set baseline: " + result.error().message());
                    return 1;
                }
                print("Baseline set to: " + snap_name);
                return 0;
            }

            const auto current = store.get_baseline();
            if (is_json()) {
                nlohmann::json out = {{"baseline", current ? nlohmann::json(*current) : nlohmann::json(nullptr)}};
                std::cout << out.dump(2) << "\n";
            } else if (current) {
                std::cout << *current << "\n";
            } else {
                print("No baseline set.");
            }
            return 0;
        }
    };

    namespace {
        struct SnapshotCommandRegistrar {
            SnapshotCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<SnapshotCommand>());
            }
        } snapshot_registrar;
    }
}  // namespace cova::cli
