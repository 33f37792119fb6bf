#include "fixtures.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

int cmd_dump(int argc, char **argv);
int cmd_show_index(int argc, char **argv);
int cmd_verify_pack(int argc, char **argv);

using fixtures::Bytes;

namespace {

struct Run {
  int rc = 0;
  std::string out;
  std::string err;
};

// Call a command with stdout and stderr captured.
Run run(int (*cmd)(int, char **), std::vector<std::string> args) {
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  const int rc = cmd(static_cast<int>(args.size()), argv.data());
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  return Run{.rc = rc, .out = out.str(), .err = err.str()};
}

} // namespace

int main() {
  try {
    fixtures::TempDir tmp{"cli"};
    const auto root = tmp.path() / "work";
    const auto git = fixtures::init_repo(root);

    // A pack entry whose bytes do not hash to the id its index lists
    const Bytes truth = fixtures::bytes("the real content");
    const Bytes lie = fixtures::bytes("something else");
    const auto id = gitpeek::object_id(gitpeek::HashKind::sha1, "blob", truth);
    fixtures::PackBuilder b;
    Bytes entry = fixtures::entry_header(3, lie.size());
    fixtures::append(entry, fixtures::zlib_compress(lie));
    b.add_raw(entry, id);
    fixtures::write_pack(git / "objects", "corrupt", b);
    const auto pack_path = git / "objects" / "pack" / "pack-corrupt.pack";
    const std::string hex = gitpeek::to_hex(id);

    {
      const auto r = run(cmd_dump, {"dump", "-C", root.string()});
      if (r.rc != 0 || r.out != hex + " blob 14\n") {
        std::cerr << "dump without --verify: rc=" << r.rc << " out=" << r.out << r.err;
        return 1;
      }
    }
    {
      const auto r = run(cmd_dump, {"dump", "-C", root.string(), "--verify"});
      if (r.rc != 1 || r.err.find("[checksum_mismatch]") == std::string::npos) {
        std::cerr << "dump --verify accepted a corrupt packed object: rc=" << r.rc << "\n";
        return 1;
      }
    }
    {
      const auto r = run(cmd_verify_pack, {"verify-pack", "--check", pack_path.string()});
      if (r.rc != 1 || r.err.find("[checksum_mismatch]") == std::string::npos) {
        std::cerr << "verify-pack --check accepted a corrupt object: rc=" << r.rc << "\n";
        return 1;
      }
    }
    {
      const auto r = run(cmd_verify_pack, {"verify-pack", pack_path.string()});
      if (r.rc != 0 || r.out != pack_path.string() + ": ok\n") {
        std::cerr << "verify-pack without checks failed: " << r.err;
        return 1;
      }
    }

    // show-index errors carry the error code name
    {
      const auto missing = (tmp.path() / "nope.idx").string();
      const auto r = run(cmd_show_index, {"show-index", missing});
      if (r.rc != 1 || r.err.rfind("show-index: ", 0) != 0 ||
          r.err.find("[io_error]") == std::string::npos) {
        std::cerr << "show-index error not reported with its code: " << r.err;
        return 1;
      }
      const auto idx_path = (git / "objects" / "pack" / "pack-corrupt.idx").string();
      const auto ok = run(cmd_show_index, {"show-index", idx_path});
      if (ok.rc != 0 || ok.out.find(hex) == std::string::npos) {
        std::cerr << "show-index did not list the entry\n";
        return 1;
      }
    }

    std::cout << "cli test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
