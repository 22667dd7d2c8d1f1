//
// Created by gregorian-rayne on 1/16/26.
//

#include "cova/cli/commands/command.hpp"
#include "cova/cli/formatter.hpp"
#include "cova/cli/progress.hpp"
#include "cova/cli/session.hpp"

#include "cova/serialization.hpp"

#include <iostream>

namespace cova::cli
{
    /**
     * Lists methods, lines and branch outcomes no test executed.
     */
    class UncoveredCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "uncovered";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List code that no test executed";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = session_arguments();
            auto analysis = analysis_arguments();
            defs.insert(defs.end(), analysis.begin(), analysis.end());
            defs.push_back({"limit", 'n', "Rows shown per table in text output, 0 for all", false, true, "50", "N"});
            return defs;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (const auto limit = args.get_int("limit"); !limit || *limit < 0) {
                return "--limit expects a non-negative number";
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
            UncoveredCodeResult result;
            if (is_json() || is_quiet()) {
                result = session.value()->service().find_uncovered_code(options.value(), cancel);
            } else {
                Spinner spinner("Collecting coverage");
                result = session.value()->service().find_uncovered_code(options.value(), cancel);
                if (result.success) spinner.success();
                else spinner.fail();
            }

            if (is_json()) {
                std::cout << serialization::serialize(result).dump(2) << "\n";
            } else if (result.success && !is_quiet()) {
                const auto limit = static_cast<std::size_t>(args.get_int("limit").value_or(50));
                SummaryPrinter(std::cout).print_uncovered(result, limit);
            }

            if (!result.success) {
                print_error(result.error_message.value_or("Coverage analysis failed"));
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct UncoveredCommandRegistrar {
            UncoveredCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<UncoveredCommand>());
            }
        } uncovered_registrar;
    }
}  // namespace cova::cli
