#include "cli/common.hpp"

#include "gitpeek/error.hpp"

#include <charconv>
#include <iostream>
#include <stdexcept>

namespace gitpeek::cli {

RepoArgs parse_repo_args(int argc, char **argv) {
  RepoArgs out;
  out.dir = std::filesystem::current_path();
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-C" || arg == "--max-depth") {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " needs a value");
      }
      const std::string value = argv[++i];
      if (arg == "-C") {
        out.dir = value;
        continue;
      }
      std::size_t n = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc{} || ptr != value.data() + value.size() || n == 0) {
        throw std::invalid_argument("--max-depth wants a positive integer, got '" + value + "'");
      }
      out.max_depth = n;
    } else if (arg == "--verify") {
      out.verify = true;
    } else {
      out.rest.push_back(arg);
    }
  }
  return out;
}

Options effective_options(const Repository &repo, const RepoArgs &args) {
  Options opts = repo.options();
  if (args.max_depth) {
    opts.max_delta_depth = *args.max_depth;
  }
  if (args.verify) {
    opts.verify_objects = true;
  }
  return opts;
}

void report(std::string_view cmd, const std::exception &e) {
  std::cerr << cmd << ": " << e.what();
  if (const auto *err = dynamic_cast<const Error *>(&e)) {
    std::cerr << " [" << errc_name(err->code()) << "]";
  }
  std::cerr << "\n";
}

} // namespace gitpeek::cli
