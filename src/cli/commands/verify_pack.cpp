#include "cli/common.hpp"

#include "gitpeek/error.hpp"
#include "gitpeek/repo.hpp"
#include "gitpeek/resolver.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <variant>

namespace fs = std::filesystem;

// Options from the repository the pack lives in, or defaults for a stray pack.
static gitpeek::Options options_for(const fs::path &pack_path, const gitpeek::cli::RepoArgs &args) {
  try {
    const auto repo = gitpeek::Repository::discover(fs::absolute(pack_path).parent_path());
    return gitpeek::cli::effective_options(repo, args);
  } catch (const gitpeek::Error &e) {
    if (e.code() != gitpeek::Errc::not_found) {
      throw;
    }
  }
  gitpeek::Options opts;
  if (args.max_depth) {
    opts.max_delta_depth = *args.max_depth;
  }
  opts.verify_objects = args.verify;
  return opts;
}

int cmd_verify_pack(int argc, char **argv) {
  try {
    const auto args = gitpeek::cli::parse_repo_args(argc, argv);
    bool verbose = false;
    bool check = false;
    fs::path pack_path;
    for (const auto &arg : args.rest) {
      if (arg == "-v" || arg == "--verbose") {
        verbose = true;
      } else if (arg == "--check") {
        check = true;
      } else if (pack_path.empty()) {
        pack_path = arg;
      } else {
        pack_path.clear();
        break;
      }
    }
    if (pack_path.empty()) {
      std::cerr << "usage: gitpeek verify-pack [-v] [--check] <file.pack>\n";
      return 2;
    }
    pack_path.replace_extension(".pack");
    fs::path idx_path = pack_path;
    idx_path.replace_extension(".idx");

    auto opts = options_for(pack_path, args);
    if (check) {
      opts.verify_objects = true;
    }
    std::vector<gitpeek::LoadedPack> packs;
    packs.push_back(gitpeek::LoadedPack{.pack = gitpeek::PackFile::open(pack_path, opts.hash_kind),
                                        .index = gitpeek::PackIndex::open(idx_path, opts.hash_kind)});
    const gitpeek::ObjectResolver resolver{
        gitpeek::ObjectStore{fs::absolute(pack_path).parent_path().parent_path(), opts.hash_kind},
        std::move(packs), opts};
    const auto &[pack, index] = resolver.packs().front();

    if (check) {
      pack.verify_checksum();
      index.verify_checksum();
    }

    // Entries in pack order; the gap to the next entry is the stored size.
    std::map<std::uint64_t, gitpeek::oid> by_offset;
    for (std::size_t i = 0; i < index.size(); ++i) {
      const auto e = index.entry(i);
      by_offset.emplace(e.offset, e.id);
    }

    std::map<std::size_t, std::size_t> chain_lengths; // depth -> count
    for (auto it = by_offset.begin(); it != by_offset.end(); ++it) {
      const auto [offset, id] = *it;
      const auto next = std::next(it);
      const std::uint64_t stored = (next == by_offset.end() ? pack.data_end() : next->first) - offset;

      const auto entry = resolver.read_pack_entry(0, offset);
      const auto obj = resolver.resolve_at(0, offset, id);
      const std::size_t depth = resolver.delta_depth(0, offset);
      ++chain_lengths[depth];

      if (!verbose) {
        continue;
      }
      std::cout << gitpeek::to_hex(id) << ' ' << gitpeek::type_name(obj.type) << ' ' << entry.size
                << ' ' << stored << ' ' << offset;
      if (depth > 0) {
        std::cout << ' ' << depth << ' ';
        if (const auto *ofs = std::get_if<gitpeek::OfsBase>(&entry.base)) {
          const auto base = by_offset.find(ofs->offset);
          std::cout << (base == by_offset.end() ? std::string("?") : gitpeek::to_hex(base->second));
        } else {
          std::cout << gitpeek::to_hex(std::get<gitpeek::oid>(entry.base));
        }
      }
      std::cout << "\n";
    }

    if (verbose) {
      for (const auto &[depth, count] : chain_lengths) {
        if (depth == 0) {
          std::cout << "non delta: " << count << " objects\n";
        } else {
          std::cout << "chain length = " << depth << ": " << count << " objects\n";
        }
      }
    }
    std::cout << pack_path.string() << ": ok\n";
    return 0;
  } catch (const std::exception &e) {
    gitpeek::cli::report("verify-pack", e);
    return 1;
  }
}
