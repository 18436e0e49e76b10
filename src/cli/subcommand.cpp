#include "subcommand.hpp"
#include "fcaudit/version.h"
#include <algorithm>
#include <iostream>

namespace fcaudit {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    for (const auto& cmd : commands_) {
        if (cmd.name == name) return;
    }
    commands_.push_back({name, description, order, std::move(fn)});
}

const SubcommandRegistry::Command* SubcommandRegistry::find(const std::string& name) const {
    const Command* prefix_match = nullptr;
    size_t prefix_hits = 0;
    for (const auto& cmd : commands_) {
        if (cmd.name == name) return &cmd;
        if (!name.empty() && cmd.name.compare(0, name.size(), name) == 0) {
            prefix_match = &cmd;
            ++prefix_hits;
        }
    }
    return prefix_hits == 1 ? prefix_match : nullptr;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const Command* cmd = find(name);
    if (!cmd) {
        std::cerr << "Unknown or ambiguous command: " << name << "\n"
                  << "Run 'fcaudit --help' for usage information.\n";
        return 1;
    }
    return cmd->run(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "fcaudit v" << FCAUDIT_VERSION << " - orbit compliance of codon usage\n\n"
              << "Usage: " << program_name << " <command> [options]\n"
              << "       " << program_name << " --map <orbits> <usage>...   (same as 'check')\n\n"
              << "Commands:\n";

    std::vector<const Command*> listed;
    size_t width = 0;
    for (const auto& cmd : commands_) {
        listed.push_back(&cmd);
        width = std::max(width, cmd.name.size());
    }
    std::stable_sort(listed.begin(), listed.end(),
                     [](const Command* a, const Command* b) { return a->order < b->order; });

    for (const Command* cmd : listed) {
        std::cout << "  " << cmd->name << std::string(width + 2 - cmd->name.size(), ' ')
                  << cmd->description << "\n";
    }
    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace fcaudit
