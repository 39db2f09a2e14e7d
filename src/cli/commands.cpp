#include "commands.hpp"
#include "protdes/version.h"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace protdes {
namespace cli {

namespace {

// In help order
constexpr Command COMMANDS[] = {
    {"design", "Optimize a protein sequence for a design target", cmd_design},
    {"score", "Score sequences from a FASTA file against a design target", cmd_score},
};

}  // namespace

const Command* find_command(const std::string& name) {
    for (const auto& cmd : COMMANDS) {
        if (name == cmd.name) return &cmd;
    }
    return nullptr;
}

void print_help(const char* program_name) {
    std::cout << "protdes v" << PROTDES_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t width = 0;
    for (const auto& cmd : COMMANDS) width = std::max(width, std::strlen(cmd.name));
    for (const auto& cmd : COMMANDS) {
        std::cout << "  " << cmd.name
                  << std::string(width + 2 - std::strlen(cmd.name), ' ')
                  << cmd.description << "\n";
    }

    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace protdes
