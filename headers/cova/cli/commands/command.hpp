//
// Created by gregorian-rayne on 1/2/26.
//

#ifndef COVA_COMMAND_HPP
#define COVA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommands of the cova executable and their option parser.
 *
 * Options are declared per command as ArgDef rows. List options such as
 * --exclude-file may be given more than once; every occurrence is kept
 * and get_list() flattens them together with any comma-separated items.
 */

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace cova::cli
{
    struct ArgDef {
        std::string name;           // --name
        char short_name = 0;        // -n
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
        bool repeatable = false;    // later occurrences append instead of replace
    };

    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void append(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;

        /**
         * Value of an option. Repeated occurrences come back joined with
         * commas.
         */
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;

        /**
         * Every occurrence split on commas, trimmed, empty items dropped.
         */
        [[nodiscard]] std::vector<std::string> get_list(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::vector<std::string>> values_;
        std::unordered_set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    /**
     * Output verbosity level.
     */
    enum class Verbosity {
        Quiet,
        Normal,
        Verbose
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    /**
     * One `cova <name>` subcommand.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * One line, shown in the command list of `cova --help`.
         */
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Usage line printed by --help and after a validation error.
         * Commands with positionals or subcommands spell them out here.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * @return Process exit code. 0 on success, 1 on error; compare
         *         uses 3 for a detected regression.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * Runs after parsing and before execute(). A non-empty message is
         * printed with the usage line and the process exits with 1.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        /**
         * Description, usage line, the command's own options and the
         * options every command accepts.
         */
        void write_help(std::ostream& out) const;
        void print_help() const;

    protected:
        /**
         * Applies --verbose, --quiet and --json.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    /**
     * Commands linked into the executable. Each *_cmd.cpp registers
     * itself from a static initializer.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        /**
         * Returns false and drops the command when the name is taken.
         */
        bool register_command(std::unique_ptr<Command> cmd);

        /**
         * Exact name, else a prefix matching exactly one command
         * ("unc" finds "uncovered").
         */
        [[nodiscard]] Command* find(std::string_view name) const;

        /**
         * Sorted by name.
         */
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments that follow the command name. --help, --verbose,
     * --quiet and --json (-h, -v, -q) are accepted for every command.
     * Defaults apply to options that were not given.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace cova::cli

#endif //COVA_COMMAND_HPP
