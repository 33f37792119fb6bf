#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <ostream>
#include <utility>

namespace gitpeek::cli {

static std::map<std::string, Command> &table() {
  static std::map<std::string, Command> t;
  return t;
}

void register_command(const std::string &name, Command cmd) { table()[name] = std::move(cmd); }

const Command *find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &out) {
  out << "usage: gitpeek <command> [-C <dir>] [--max-depth <n>] [--verify] [args]\n\n";
  std::size_t width = 0;
  for (const auto &[name, cmd] : table()) {
    width = std::max(width, name.size());
  }
  out << "commands:\n";
  for (const auto &[name, cmd] : table()) {
    out << "  " << std::left << std::setw(static_cast<int>(width)) << name << "  " << cmd.help
        << "\n"
        << "  " << std::setw(static_cast<int>(width)) << "" << "    gitpeek " << name << " "
        << cmd.synopsis << "\n";
  }
}

} // namespace gitpeek::cli
