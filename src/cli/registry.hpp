#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string>

namespace gitpeek::cli {

struct Command {
  command_fn fn = nullptr;
  std::string synopsis; // arguments after the command name
  std::string help;
};

void register_command(const std::string& name, Command cmd);

// nullptr if no command has that name.
const Command* find_command(const std::string& name);

void print_usage(std::ostream& out);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitpeek::cli
