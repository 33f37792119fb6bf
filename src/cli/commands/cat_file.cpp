#include "cli/common.hpp"

#include "gitpeek/error.hpp"
#include "gitpeek/repo.hpp"
#include "gitpeek/resolver.hpp"

#include <iostream>
#include <string>

int cmd_cat_file(int argc, char **argv) {
  try {
    const auto args = gitpeek::cli::parse_repo_args(argc, argv);
    if (args.rest.size() != 2 || args.rest[0].size() != 2 || args.rest[0][0] != '-') {
      std::cerr << "usage: gitpeek cat-file (-t|-s|-p|-e) <object>\n";
      return 2;
    }
    const char mode = args.rest[0][1];
    const std::string &name = args.rest[1];

    const auto repo = gitpeek::Repository::discover(args.dir);
    const gitpeek::ObjectResolver resolver{repo, gitpeek::cli::effective_options(repo, args)};

    if (mode == 'e') {
      try {
        return resolver.contains(resolver.resolve_prefix(name)) ? 0 : 1;
      } catch (const gitpeek::Error &e) {
        if (e.code() == gitpeek::Errc::not_found) {
          return 1;
        }
        throw;
      }
    }

    const auto obj = resolver.resolve(name);
    switch (mode) {
    case 't':
      std::cout << gitpeek::type_name(obj.type) << "\n";
      break;
    case 's':
      std::cout << obj.size << "\n";
      break;
    case 'p':
      std::cout.write(reinterpret_cast<const char *>(obj.data.data()),
                      static_cast<std::streamsize>(obj.data.size()));
      break;
    default:
      std::cerr << "cat-file: unknown mode -" << mode << "\n";
      return 2;
    }
    return std::cout ? 0 : 1;
  } catch (const std::exception &e) {
    gitpeek::cli::report("cat-file", e);
    return 1;
  }
}
