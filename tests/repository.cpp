#include "fixtures.hpp"

#include "gitpeek/config.hpp"
#include "gitpeek/error.hpp"
#include "gitpeek/repo.hpp"

#include <filesystem>
#include <iostream>

using gitpeek::Errc;
using gitpeek::HashKind;
using gitpeek::Options;
using gitpeek::Repository;

static bool same_dir(const std::filesystem::path &a, const std::filesystem::path &b) {
  return std::filesystem::equivalent(a, b);
}

int main() {
  try {
    // Config keys, case-insensitive names, comments and bare booleans
    {
      const auto opts = gitpeek::parse_options("[core]\n"
                                               "\trepositoryformatversion = 1\n"
                                               "[extensions]\n"
                                               "\tobjectFormat = SHA256\n"
                                               "[gitpeek]  # local settings\n"
                                               "\tmaxDeltaDepth = 10 ; keep chains short\n"
                                               "\tverifyObjects\n"
                                               "[remote \"origin\"]\n"
                                               "\tmaxdeltadepth = 999\n");
      if (opts.hash_kind != HashKind::sha256 || opts.max_delta_depth != 10 || !opts.verify_objects) {
        std::cerr << "config keys not applied\n";
        return 1;
      }

      const auto defaults = gitpeek::parse_options("");
      if (defaults.hash_kind != HashKind::sha1 || defaults.max_delta_depth != 4096 ||
          defaults.verify_objects) {
        std::cerr << "defaults wrong\n";
        return 1;
      }

      Options base;
      base.max_delta_depth = 7;
      const auto kept = gitpeek::parse_options("[gitpeek]\n\tverifyobjects = \"off\"\n", base);
      if (kept.max_delta_depth != 7 || kept.verify_objects) {
        std::cerr << "base options not carried through\n";
        return 1;
      }

      const char *bad[] = {
          "[gitpeek]\n\tmaxdeltadepth = 0\n",
          "[gitpeek]\n\tmaxdeltadepth = lots\n",
          "[gitpeek]\n\tverifyobjects = maybe\n",
          "[extensions]\n\tobjectformat = md5\n",
          "[gitpeek\n\tverifyobjects\n",
      };
      for (const char *text : bad) {
        if (!fixtures::throws_code([&] { (void)gitpeek::parse_options(text); },
                                   Errc::malformed_header)) {
          std::cerr << "bad config accepted:\n" << text;
          return 1;
        }
      }
    }

    fixtures::TempDir tmp{"repository"};

    // Work tree: found from a nested directory, config read from .git/config
    {
      const auto root = tmp.path() / "work";
      const auto git = fixtures::init_repo(root);
      fixtures::write_file(git / "config", fixtures::bytes("[gitpeek]\n\tmaxdeltadepth = 3\n"));
      std::filesystem::create_directories(root / "a" / "b");

      const auto repo = Repository::discover(root / "a" / "b");
      if (!same_dir(repo.git_dir(), git) || !same_dir(repo.objects_dir(), git / "objects")) {
        std::cerr << "work tree not discovered: " << repo.git_dir() << "\n";
        return 1;
      }
      if (repo.options().max_delta_depth != 3) {
        std::cerr << "repository config not loaded\n";
        return 1;
      }

      // Only packs with a companion index, in name order
      fixtures::PackBuilder b;
      b.add_object(gitpeek::ObjectType::blob, fixtures::bytes("x"));
      fixtures::write_pack(git / "objects", "bbb", b);
      fixtures::write_pack(git / "objects", "aaa", b);
      fixtures::write_file(git / "objects" / "pack" / "pack-ccc.pack", b.pack());
      const auto packs = repo.packs();
      if (packs.size() != 2 || packs[0].pack.filename() != "pack-aaa.pack" ||
          packs[1].index.filename() != "pack-bbb.idx") {
        std::cerr << "pack listing wrong (" << packs.size() << " packs)\n";
        return 1;
      }
    }

    // ".git" file pointing elsewhere
    {
      const auto real = tmp.path() / "real.git";
      std::filesystem::create_directories(real / "objects");
      fixtures::write_file(real / "HEAD", fixtures::bytes("ref: refs/heads/main\n"));
      const auto linked = tmp.path() / "linked";
      fixtures::write_file(linked / ".git", fixtures::bytes("gitdir: ../real.git\n"));

      const auto repo = Repository::discover(linked);
      if (!same_dir(repo.git_dir(), real)) {
        std::cerr << "gitdir link not followed: " << repo.git_dir() << "\n";
        return 1;
      }
      if (repo.options().max_delta_depth != 4096 || !repo.packs().empty()) {
        std::cerr << "repository without config or packs mishandled\n";
        return 1;
      }

      const auto broken = tmp.path() / "broken";
      fixtures::write_file(broken / ".git", fixtures::bytes("not a link\n"));
      if (!fixtures::throws_code([&] { (void)Repository::discover(broken); },
                                 Errc::malformed_header)) {
        std::cerr << "broken gitdir link accepted\n";
        return 1;
      }
    }

    // Bare repository
    {
      const auto bare = tmp.path() / "bare.git";
      std::filesystem::create_directories(bare / "objects" / "pack");
      fixtures::write_file(bare / "HEAD", fixtures::bytes("ref: refs/heads/main\n"));
      if (!same_dir(Repository::discover(bare).git_dir(), bare)) {
        std::cerr << "bare repository not discovered\n";
        return 1;
      }
    }

    std::cout << "repository test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
