#include "cli/common.hpp"

#include "gitpeek/repo.hpp"
#include "gitpeek/resolver.hpp"

#include <iostream>

static void print_line(const gitpeek::oid &id, const gitpeek::DecodedObject &obj) {
  std::cout << gitpeek::to_hex(id) << ' ' << gitpeek::type_name(obj.type) << ' ' << obj.size
            << "\n";
}

int cmd_dump(int argc, char **argv) {
  try {
    const auto args = gitpeek::cli::parse_repo_args(argc, argv);
    if (!args.rest.empty()) {
      std::cerr << "usage: gitpeek dump [-C <dir>]\n";
      return 2;
    }
    const auto repo = gitpeek::Repository::discover(args.dir);
    const gitpeek::ObjectResolver resolver{repo, gitpeek::cli::effective_options(repo, args)};

    // Loose objects first, then each pack in index order
    for (const auto &id : resolver.loose().list()) {
      print_line(id, resolver.resolve(id));
    }
    for (std::size_t p = 0; p < resolver.packs().size(); ++p) {
      const auto &index = resolver.packs()[p].index;
      for (std::size_t i = 0; i < index.size(); ++i) {
        const auto e = index.entry(i);
        print_line(e.id, resolver.resolve_at(p, e.offset, e.id));
      }
    }
    return 0;
  } catch (const std::exception &e) {
    gitpeek::cli::report("dump", e);
    return 1;
  }
}
