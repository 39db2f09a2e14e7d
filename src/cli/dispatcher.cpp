// Main entry point for the protdes CLI
//
// Usage:
//   protdes design [options]              Optimize a sequence for a design target
//   protdes score <input.fa> [options]    Score existing sequences against a target

#include "commands.hpp"
#include "protdes/version.h"
#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        protdes::cli::print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (std::strcmp(first_arg, "--help") == 0 || std::strcmp(first_arg, "-h") == 0) {
        protdes::cli::print_help(argv[0]);
        return 0;
    }

    if (std::strcmp(first_arg, "--version") == 0 || std::strcmp(first_arg, "-V") == 0) {
        std::cout << "protdes " << PROTDES_VERSION << "\n";
        return 0;
    }

    if (const auto* cmd = protdes::cli::find_command(first_arg)) {
        return cmd->run(argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'protdes --help' for usage information.\n";
    return 1;
}
