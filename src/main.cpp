#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  gitpeek::cli::register_all_commands();

  if (argc < 2) {
    gitpeek::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string name = argv[1];
  if (name == "-h" || name == "--help" || name == "help") {
    gitpeek::cli::print_usage(std::cout);
    return 0;
  }

  const auto *cmd = gitpeek::cli::find_command(name);
  if (cmd == nullptr) {
    std::cerr << "gitpeek: '" << name << "' is not a command\n";
    gitpeek::cli::print_usage(std::cerr);
    return 2;
  }
  // argv[0] of the handler is the subcommand name
  return cmd->fn(argc - 1, argv + 1);
}
