#include "cli/common.hpp"

#include "gitpeek/hash.hpp"
#include "gitpeek/pack_index.hpp"

#include <cstdio>
#include <iostream>
#include <string>

int cmd_show_index(int argc, char **argv) {
  gitpeek::HashKind kind = gitpeek::HashKind::sha1;
  std::string path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--sha256") {
      kind = gitpeek::HashKind::sha256;
    } else if (path.empty()) {
      path = arg;
    } else {
      path.clear();
      break;
    }
  }
  if (path.empty()) {
    std::cerr << "usage: gitpeek show-index [--sha256] <file.idx>\n";
    return 2;
  }

  try {
    const auto index = gitpeek::PackIndex::open(path, kind);
    for (std::size_t i = 0; i < index.size(); ++i) {
      const auto e = index.entry(i);
      std::cout << e.offset << ' ' << gitpeek::to_hex(e.id);
      if (e.crc32) {
        char crc[16];
        std::snprintf(crc, sizeof(crc), "%08x", *e.crc32);
        std::cout << " (" << crc << ")";
      }
      std::cout << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    gitpeek::cli::report("show-index", e);
    return 1;
  }
}
