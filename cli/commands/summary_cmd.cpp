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
    class SummaryCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "summary";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Run tests with coverage and print only the totals";
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
            CoverageSummaryResult result;
            if (is_json() || is_quiet()) {
                result = session.value()->service().get_coverage_summary(options.value(), cancel);
            } else {
                Spinner spinner("Collecting coverage");
                result = session.value()->service().get_coverage_summary(options.value(), cancel);
                if (result.success) spinner.success();
                else spinner.fail();
            }

            if (is_json()) {
                std::cout << serialization::serialize(result).dump(2) << "\n";
            } else if (result.success && !is_quiet()) {
                SummaryPrinter(std::cout).print_summary(result.summary);
            }

            if (!result.success) {
                print_error(result.error_message.value_or("Coverage analysis failed"));
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct SummaryCommandRegistrar {
            SummaryCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<SummaryCommand>());
            }
        } summary_registrar;
    }
}  // namespace cova::cli
