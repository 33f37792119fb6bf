#pragma once
#include "gitpeek/config.hpp"
#include "gitpeek/consts.hpp"

#include <filesystem>
#include <vector>

namespace gitpeek {

struct PackPair {
  std::filesystem::path pack;  // objects/pack/pack-<id>.pack
  std::filesystem::path index; // objects/pack/pack-<id>.idx
};

// Finds the pieces of an on-disk repository; reads nothing but directory listings and config.
class Repository {
public:
  explicit Repository(std::filesystem::path git_dir) : git_dir_(std::move(git_dir)) {}

  /**
   * Locate the git directory for `start`, checking `start` and then each parent:
   *   <dir>/.git/           a normal work tree
   *   <dir>/.git  (file)    "gitdir: <path>" indirection (worktrees, submodules)
   *   <dir>/                a bare repository (has objects/ and HEAD)
   * Throws Error{not_found} if nothing matches.
   */
  static Repository discover(const std::filesystem::path& start);

  // Core paths
  [[nodiscard]] const std::filesystem::path& git_dir() const { return git_dir_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return git_dir_ / consts::kObjectsDir;
  }
  [[nodiscard]] auto pack_dir() const -> std::filesystem::path {
    return objects_dir() / consts::kPackDir;
  }

  // *.pack files that have a matching *.idx, sorted by name. Packs without an index are skipped.
  [[nodiscard]] std::vector<PackPair> packs() const;

  [[nodiscard]] Options options() const { return load_options(git_dir_); }

private:
  std::filesystem::path git_dir_;
};

} // namespace gitpeek
