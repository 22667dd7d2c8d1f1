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
    class MethodCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "method";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show line and branch coverage of one method";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cova method <CLASS> <METHOD> [OPTIONS]\n\n"
                   "CLASS may be fully qualified (MyApp.Services.OrderService) or the simple name.\n\n"
                   "Examples:\n"
                   "  cova method OrderService PlaceOrder\n"
                   "  cova method MyApp.Services.OrderService PlaceOrder --json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = session_arguments();
            auto analysis = analysis_arguments();
            defs.insert(defs.end(), analysis.begin(), analysis.end());
            return defs;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.get_flag("help")) {
                return "";
            }
            if (args.positional().size() != 2) {
                return "Expected <CLASS> <METHOD>";
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }
            apply_common_flags(args);

            const std::string& class_name = args.positional()[0];
            const std::string& method_name = args.positional()[1];

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
            MethodCoverageResult result;
            if (is_json() || is_quiet()) {
                result = session.value()->service().get_method_coverage(class_name, method_name, options.value(), cancel);
            } else {
                Spinner spinner("Collecting coverage");
                result = session.value()->service().get_method_coverage(class_name, method_name, options.value(), cancel);
                if (result.success) spinner.success();
                else spinner.fail();
            }

            if (is_json()) {
                std::cout << serialization::serialize(result).dump(2) << "\n";
            } else if (result.success && result.method && !is_quiet()) {
                SummaryPrinter(std::cout).print_method(*result.method);
            }

            if (!result.success) {
                print_error(result.error_message.value_or("Method lookup failed"));
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct MethodCommandRegistrar {
            MethodCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<MethodCommand>());
            }
        } method_registrar;
    }
}  // namespace cova::cli
