//
// Created by gregorian-rayne on 1/2/26.
//

#include "cova/cli/commands/command.hpp"
#include "cova/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <ostream>
#include <sstream>

namespace cova::cli
{
    namespace {

        struct CommonFlag {
            std::string_view name;
            char short_name;
            std::string_view description;
        };

        constexpr std::array<CommonFlag, 4> kCommonFlags{{
            {"help", 'h', "Show this help message"},
            {"verbose", 'v', "Debug logging and extra detail"},
            {"quiet", 'q', "Only show errors"},
            {"json", 0, "Print results as JSON"}
        }};

        const CommonFlag* common_flag(const std::string_view name) {
            for (const auto& flag : kCommonFlags) {
                if (flag.name == name) return &flag;
            }
            return nullptr;
        }

        const CommonFlag* common_flag(const char short_name) {
            for (const auto& flag : kCommonFlags) {
                if (flag.short_name != 0 && flag.short_name == short_name) return &flag;
            }
            return nullptr;
        }

        // "-t, --timeout <MINUTES>" or "    --sequential"
        std::string option_label(const char short_name, const std::string_view name, const std::string_view value) {
            std::string label = short_name ? std::string("-") + short_name + ", " : std::string(4, ' ');
            label += "--";
            label += name;
            if (!value.empty()) {
                label += " <";
                label += value;
                label += ">";
            }
            return label;
        }

        void write_row(std::ostream& out, const std::string& label, const std::size_t width, const std::string& text) {
            out << "  " << label;
            out << std::string(width > label.size() ? width - label.size() : 0, ' ');
            out << "  " << text << "\n";
        }

        /**
         * Walks argv once. Each handler returns false after recording an
         * error in the result.
         */
        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args)
            {
                for (const auto& def : defs) {
                    by_name_[def.name] = &def;
                    if (def.short_name) {
                        by_short_[def.short_name] = &def;
                    }
                }
            }

            ParseResult run(const std::vector<ArgDef>& defs) {
                bool options_ended = false;

                for (index_ = 0; index_ < args_.size(); ++index_) {
                    const std::string& arg = args_[index_];
                    if (arg.empty()) continue;

                    if (options_ended || arg[0] != '-' || arg == "-") {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        if (!long_option(arg.substr(2))) return std::move(result_);
                    } else if (!short_options(arg)) {
                        return std::move(result_);
                    }
                }

                for (const auto& def : defs) {
                    if (!def.default_value.empty() && !result_.args.has(def.name)) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
                return std::move(result_);
            }

        private:
            bool fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
                return false;
            }

            void store(const ArgDef& def, const std::string& value) {
                if (def.repeatable) {
                    result_.args.append(def.name, value);
                } else {
                    result_.args.set(def.name, value);
                }
            }

            std::optional<std::string> next_value() {
                if (index_ + 1 < args_.size()) {
                    return args_[++index_];
                }
                return std::nullopt;
            }

            bool long_option(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = by_name_.find(name);
                if (it == by_name_.end()) {
                    if (common_flag(name) != nullptr && !inline_value) {
                        result_.args.set_flag(name);
                        return true;
                    }
                    return fail("Unknown option: --" + name);
                }

                const ArgDef& def = *it->second;
                if (!def.takes_value) {
                    if (inline_value) {
                        return fail("Option --" + name + " does not take a value");
                    }
                    result_.args.set_flag(name);
                    return true;
                }

                const auto value = inline_value ? inline_value : next_value();
                if (!value || value->empty()) {
                    return fail("Option --" + name + " requires a value");
                }
                store(def, *value);
                return true;
            }

            // -qb, -t15, -t 15. A value option takes the rest of the cluster.
            bool short_options(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char c = arg[j];

                    const auto it = by_short_.find(c);
                    if (it == by_short_.end()) {
                        if (const auto* flag = common_flag(c)) {
                            result_.args.set_flag(std::string(flag->name));
                            continue;
                        }
                        return fail(std::string("Unknown option: -") + c);
                    }

                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    const auto value = j + 1 < arg.size() ? std::optional(arg.substr(j + 1)) : next_value();
                    if (!value || value->empty()) {
                        return fail(std::string("Option -") + c + " requires a value");
                    }
                    store(def, *value);
                    return true;
                }
                return true;
            }

            const std::vector<std::string>& args_;
            std::unordered_map<std::string, const ArgDef*> by_name_;
            std::unordered_map<char, const ArgDef*> by_short_;
            std::size_t index_ = 0;
            ParseResult result_;
        };

    }  // namespace

    // ============================================================================
    // ParsedArgs
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        values_[name] = {value};
    }

    void ParsedArgs::append(const std::string& name, const std::string& value) {
        values_[name].push_back(value);
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_.insert(name);
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return string_utils::join(it->second, ",");
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end() || it->second.size() != 1) {
            return std::nullopt;
        }
        return string_utils::parse_int(it->second.front());
    }

    std::vector<std::string> ParsedArgs::get_list(const std::string& name) const {
        std::vector<std::string> items;
        const auto it = values_.find(name);
        if (it == values_.end()) {
            return items;
        }
        for (const auto& occurrence : it->second) {
            for (const auto part : string_utils::split(occurrence, ',')) {
                if (const auto trimmed = string_utils::trim(part); !trimmed.empty()) {
                    items.emplace_back(trimmed);
                }
            }
        }
        return items;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: cova " << name();
        for (const auto& arg : arguments()) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }
        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::write_help(std::ostream& out) const {
        out << description() << "\n\n" << usage() << "\n\n";

        const auto args = arguments();

        std::vector<std::string> labels;
        labels.reserve(args.size());
        std::size_t width = 0;
        for (const auto& arg : args) {
            labels.push_back(option_label(arg.short_name, arg.name, arg.takes_value ? arg.value_name : ""));
            width = std::max(width, labels.back().size());
        }
        for (const auto& flag : kCommonFlags) {
            width = std::max(width, option_label(flag.short_name, flag.name, "").size());
        }

        if (!args.empty()) {
            out << "Options:\n";
            for (std::size_t i = 0; i < args.size(); ++i) {
                const auto& arg = args[i];
                std::string text = arg.description;
                if (!arg.default_value.empty()) {
                    text += " (default: " + arg.default_value + ")";
                }
                if (arg.repeatable) {
                    text += " [repeatable]";
                }
                if (arg.required) {
                    text += " [required]";
                }
                write_row(out, labels[i], width, text);
            }
            out << "\n";
        }

        out << "Common options:\n";
        for (const auto& flag : kCommonFlags) {
            write_row(out, option_label(flag.short_name, flag.name, ""), width, std::string(flag.description));
        }
    }

    void Command::print_help() const {
        write_help(std::cout);
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        } else if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        }
        if (args.get_flag("json")) {
            output_format_ = OutputFormat::JSON;
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    bool CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        const auto taken = std::any_of(commands_.begin(), commands_.end(), [&](const auto& existing) {
            return existing->name() == cmd->name();
        });
        if (taken) {
            return false;
        }
        commands_.push_back(std::move(cmd));
        return true;
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        if (name.empty()) {
            return nullptr;
        }

        Command* prefix_match = nullptr;
        std::size_t prefix_matches = 0;
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
            if (cmd->name().starts_with(name)) {
                prefix_match = cmd.get();
                ++prefix_matches;
            }
        }
        return prefix_matches == 1 ? prefix_match : nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        std::sort(result.begin(), result.end(), [](const Command* a, const Command* b) {
            return a->name() < b->name();
        });
        return result;
    }

    // ============================================================================
    // Argument Parser
    // ============================================================================

    ParseResult parse_arguments(const std::vector<std::string>& args, const std::vector<ArgDef>& defs) {
        return ArgumentParser(args, defs).run(defs);
    }
}  // namespace cova::cli
