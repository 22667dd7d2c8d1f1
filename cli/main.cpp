//
// Created by gregorian on 15/12/2025.
//

#include "cova/cli/commands/command.hpp"
#include "cova/cli/formatter.hpp"

#include <iostream>
#include <exception>
#include <string>
#include <vector>

#ifndef COVA_VERSION
#define COVA_VERSION "0.0.0"
#endif

namespace {

    void print_help() {
        std::cout << "cova " << COVA_VERSION << " - test coverage analysis for .NET solutions\n\n"
                  << "Usage: cova <command> [OPTIONS]\n\n"
                  << "Commands:\n";
        for (const auto* cmd : cova::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << cmd->name();
            for (std::size_t pad = cmd->name().size(); pad < 12; ++pad) {
                std::cout << ' ';
            }
            std::cout << cmd->description() << "\n";
        }
        std::cout << "\nGlobal options:\n"
                  << "  --no-color              Disable colored output\n"
                  << "  --version               Print the version\n"
                  << "\nCommands may be shortened to any unique prefix.\n"
                  << "Run 'cova <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (std::string arg = argv[i]; arg == "--no-color") {
            cova::cli::colors::set_enabled(false);
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        print_help();
        return args.empty() ? 1 : 0;
    }
    if (args[0] == "--version" || args[0] == "version") {
        std::cout << "cova " << COVA_VERSION << "\n";
        return 0;
    }

    auto* command = cova::cli::CommandRegistry::instance().find(args[0]);
    if (command == nullptr) {
        std::cerr << "error: Unknown command: " << args[0] << "\n\n";
        print_help();
        return 1;
    }

    try {
        const std::vector<std::string> rest(args.begin() + 1, args.end());
        const auto parsed = cova::cli::parse_arguments(rest, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const auto problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n\n" << command->usage() << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
