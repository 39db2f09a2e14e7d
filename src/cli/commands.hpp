#ifndef PROTDES_CLI_COMMANDS_HPP
#define PROTDES_CLI_COMMANDS_HPP

#include <string>

namespace protdes {
namespace cli {

// argv[0] is the command name; returns the process exit code
int cmd_design(int argc, char* argv[]);
int cmd_score(int argc, char* argv[]);

struct Command {
    const char* name;
    const char* description;
    int (*run)(int argc, char* argv[]);
};

// nullptr for an unknown name
const Command* find_command(const std::string& name);

void print_help(const char* program_name);

}  // namespace cli
}  // namespace protdes

#endif  // PROTDES_CLI_COMMANDS_HPP
