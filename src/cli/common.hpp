#pragma once
#include "gitpeek/resolver.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitpeek::cli {

// Flags shared by every command that reads a repository.
struct RepoArgs {
  std::filesystem::path dir;            // -C <dir>, default: current directory
  std::optional<std::size_t> max_depth; // --max-depth <n>
  bool verify = false;                  // --verify
  std::vector<std::string> rest;        // everything else, in order
};

// Parse argv[1..argc) of a subcommand. Throws std::invalid_argument on a bad flag value.
RepoArgs parse_repo_args(int argc, char **argv);

// Repository config with command-line overrides applied on top.
Options effective_options(const Repository &repo, const RepoArgs &args);

// Print "<cmd>: <message> [<error code>]" to stderr.
void report(std::string_view cmd, const std::exception &e);

} // namespace gitpeek::cli
