#ifndef FCAUDIT_CLI_SUBCOMMAND_HPP
#define FCAUDIT_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <vector>

namespace fcaudit {
namespace cli {

// argv[0] is the command name
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Commands self-register from static objects in their cmd_*.cpp file.
class SubcommandRegistry {
public:
    struct Command {
        std::string name;
        std::string description;
        int order = 99;         // position in --help
        SubcommandFn run;
    };

    static SubcommandRegistry& instance();

    // First registration of a name wins
    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    // Exact name, or a prefix matching exactly one command; nullptr otherwise
    const Command* find(const std::string& name) const;

    int run_command(const std::string& name, int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::vector<Command> commands_;
};

int cmd_check(int argc, char* argv[]);
int cmd_inspect_map(int argc, char* argv[]);
int cmd_orbit_profile(int argc, char* argv[]);

}  // namespace cli
}  // namespace fcaudit

#endif  // FCAUDIT_CLI_SUBCOMMAND_HPP
