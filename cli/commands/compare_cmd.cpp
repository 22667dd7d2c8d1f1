//
// Created by gregorian-rayne on 1/16/26.
//

#include "cova/cli/commands/command.hpp"
#include "cova/cli/formatter.hpp"
#include "cova/cli/progress.hpp"
#include "cova/cli/session.hpp"

#include "cova/serialization.hpp"
#include "cova/utils/file_utils.hpp"

#include <iostream>
#include <sstream>

namespace cova::cli
{
    /**
     * Runs a fresh analysis and compares it with a saved one.
     *
     * Exit codes: 0 on success, 1 on error, 3 when --fail-on-regression
     * is set and line coverage went down.
     */
    class CompareCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "compare";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Compare current coverage against a baseline";
        }

        [[nodiscard]] std::string usage() const override {
            std::ostringstream ss;
            ss << "Usage: cova compare [--snapshot NAME | --baseline-file FILE] [OPTIONS]\n\n"
               << "Without --snapshot or --baseline-file the stored baseline snapshot is used.\n\n"
               << "Examples:\n"
               << "  cova compare --snapshot main\n"
               << "  cova compare --baseline-file previous.json --fail-on-regression";
            return ss.str();
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = session_arguments();
            auto analysis = analysis_arguments();
            defs.insert(defs.end(), analysis.begin(), analysis.end());
            defs.push_back({"snapshot", 0, "Snapshot to compare against", false, true, "", "NAME"});
            defs.push_back({"baseline-file", 'b', "Analysis JSON written by 'cova run --json'", false, true, "", "FILE"});
            defs.push_back({"fail-on-regression", 0, "Exit with code 3 when line coverage regressed", false, false, "", ""});
            defs.push_back({"limit", 'n', "Entries shown per list in text output, 0 for all", false, true, "20", "N"});
            return defs;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.has("snapshot") && args.has("baseline-file")) {
                return "--snapshot and --baseline-file are mutually exclusive";
            }
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

            auto baseline = load_baseline(*session.value(), args);
            if (baseline.is_err()) {
                print_error(baseline.error().message());
                return 1;
            }

            const auto cancel = install_interrupt_handler();
            CoverageComparisonResult result;
            if (is_json() || is_quiet()) {
                result = session.value()->service().compare_coverage(baseline.value(), options.value(), cancel);
            } else {
                Spinner spinner("Collecting current coverage");
                result = session.value()->service().compare_coverage(baseline.value(), options.value(), cancel);
                if (result.success) spinner.success();
                else spinner.fail();
            }

            if (is_json()) {
                std::cout << serialization::serialize(result).dump(2) << "\n";
            } else if (result.success && !is_quiet()) {
                const auto limit = static_cast<std::size_t>(args.get_int("limit").value_or(20));
                SummaryPrinter(std::cout).print_comparison(result, limit);
            }

            if (!result.success) {
                print_error(result.error_message.value_or("Comparison failed"));
                return 1;
            }
            if (args.get_flag("fail-on-regression") && result.delta.is_regression()) {
                print_error("Line coverage regressed by " + format_change(result.delta.lines_coverage_change));
                return 3;
            }
            return 0;
        }

    private:
        Result<CoverageAnalysisResult, Error> load_baseline(const Session& session, const ParsedArgs& args) const {
            using R = Result<CoverageAnalysisResult, Error>;

            if (const auto file = args.get("baseline-file")) {
                auto content = file_utils::read_file(*file);
                if (content.is_err()) {
                    return R::failure(content.error());
                }
                nlohmann::json j = nlohmann::json::parse(content.value(), nullptr, false);
                if (j.is_discarded()) {
                    return R::failure(Error::parse_error("Baseline file is not valid JSON", *file));
                }
                return serialization::deserialize_analysis(j);
            }

            const auto store = session.snapshot_store();
            std::string name;
            if (const auto snap = args.get("snapshot")) {
                name = *snap;
            } else if (const auto baseline = store.get_baseline()) {
                name = *baseline;
            } else {
                return R::failure(Error::not_found(
                    "No baseline snapshot set. Use --snapshot, --baseline-file or 'cova snapshot baseline NAME'."));
            }

            print_verbose("Comparing against snapshot: " + name);
            auto snapshot = store.load(name);
            if (snapshot.is_err()) {
                return R::failure(snapshot.error());
            }
            return R::success(std::move(snapshot.value().analysis));
        }
    };

    namespace {
        struct CompareCommandRegistrar {
            CompareCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<CompareCommand>());
            }
        } compare_registrar;
    }
}  // namespace cova::cli
