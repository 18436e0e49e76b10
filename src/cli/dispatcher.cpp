// fcaudit entry point: subcommand dispatch
//
// Usage:
//   fcaudit check --map <orbits> <usage>...   Orbit compliance + null model
//   fcaudit orbit-profile --map <orbits> ...  Within-orbit CV per orbit
//   fcaudit inspect-map <orbits>              Validate and print an orbit map

#include "subcommand.hpp"
#include "fcaudit/version.h"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    auto& registry = fcaudit::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const std::string first_arg = argv[1];

    if (first_arg == "--help" || first_arg == "-h") {
        registry.print_help(argv[0]);
        return 0;
    }

    if (first_arg == "--version" || first_arg == "-V") {
        std::cout << "fcaudit " << FCAUDIT_VERSION << "\n";
        return 0;
    }

    // Options first: run 'check' with the full argument list
    if (first_arg[0] == '-') {
        std::vector<char*> args(argv, argv + argc);
        static char check_name[] = "check";
        args[0] = check_name;
        return registry.run_command("check", argc, args.data());
    }

    return registry.run_command(first_arg, argc - 1, argv + 1);
}
