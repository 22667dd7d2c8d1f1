//
// Created by gregorian-rayne on 1/16/26.
//

#include "cova/cli/commands/command.hpp"
#include "cova/cli/formatter.hpp"
#include "cova/cli/progress.hpp"
#include "cova/cli/session.hpp"

#include "cova/serialization.hpp"

#include <iostream>
#include <sstream>

namespace cova::cli
{
    /**
     * Runs every selected test project with coverage collection and
     * prints the full analysis.
     */
    class RunCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "run";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Run tests with coverage and report the results";
        }

        [[nodiscard]] std::string usage() const override {
            std::ostringstream ss;
            ss << "Usage: cova run [OPTIONS]\n\n"
               << "Examples:\n"
               << "  cova run -w src/App.sln\n"
               << "  cova run --filter \"Category=Unit\" --timeout 5\n"
               << "  cova run --save before-refactor --json";
            return ss.str();
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = session_arguments();
            auto analysis = analysis_arguments();
            defs.insert(defs.end(), analysis.begin(), analysis.end());
            defs.push_back({"save", 's', "Save the analysis as a named snapshot", false, true, "", "NAME"});
            defs.push_back({"description", 'd', "Description for the saved snapshot", false, true, "", "TEXT"});
            defs.push_back({"tag", 0, "Comma-separated tags for the saved snapshot", false, true, "", "TAGS", true});
            return defs;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (!args.positional().empty()) {
                return "Unexpected argument: " + args.positional()[0];
            }
            if (args.has("description") && !args.has("save")) {
                return "--description requires --save";
            }
            if (const auto snap = args.get("save"); snap && !storage::is_valid_snapshot_name(*snap)) {
                return "Invalid snapshot name: " + *snap;
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }
            apply_common_flags(args);

            auto session = Session::open(args);
            if (session.is_err()) {
                print_error(session.error().message());
                return 1;
            }
            auto options = build_options(session.value()->config(), args);
            if (options.is_err()) {
                print_error(options.error().message());
                return 1;
            }

            const auto cancel = install_interrupt_handler();
            CoverageAnalysisResult result;
            if (is_json() || is_quiet()) {
                result = session.value()->service().run_coverage_analysis(options.value(), cancel);
            } else {
                Spinner spinner("Running tests with coverage");
                result = session.value()->service().run_coverage_analysis(options.value(), cancel);
                if (result.success) {
                    spinner.success(format_duration(result.execution_duration));
                } else {
                    spinner.fail(result.error_message.value_or("failed"));
                }
            }

            if (is_json()) {
                std::cout << serialization::serialize(result).dump(2) << "\n";
            } else if (!is_quiet()) {
                const SummaryPrinter printer(std::cout);
                printer.print_summary(result.summary);
                printer.print_projects(result.projects);
                if (is_verbose() || !result.success) {
                    printer.print_runs(result.project_runs);
                }
                printer.print_tests(result.test_results);
            }

            for (const auto& run : result.project_runs) {
                if (!run.success && result.success) {
                    print_warning(run.project_name + ": " + run.error_message);
                }
            }

            if (!result.success) {
                print_error(result.error_message.value_or("Coverage analysis failed"));
                return 1;
            }

            if (const auto snap = args.get("save")) {
                const auto tags = args.get_list("tag");
                const auto store = session.value()->snapshot_store();
                if (auto saved = store.save(*snap, result, args.get_or("description", ""), tags); saved.is_err()) {
                    print_error("Failed to save snapshot: " + saved.error().message());
                    return 1;
                }
                if (!is_json()) {
                    print("Snapshot saved: " + *snap);
                }
            }
            return 0;
        }
    };

    namespace {
        struct RunCommandRegistrar {
            RunCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<RunCommand>());
            }
        } run_registrar;
    }
}  // namespace cova::cli
