#pragma once
#include "gitpeek/consts.hpp"
#include "gitpeek/hash.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace gitpeek {

struct Options {
  std::size_t max_delta_depth = consts::kDefaultMaxDeltaDepth; // deltas per chain, exclusive
  bool verify_objects = false;                                // rehash every resolved object
  HashKind hash_kind = HashKind::sha1;
};

/**
 * Apply the keys gitpeek understands from git-config syntax on top of `base`:
 *   [extensions] objectformat = sha1|sha256
 *   [gitpeek]    maxdeltadepth = <n>   verifyobjects = <bool>
 * Unknown sections and keys are ignored. Bad values throw Error{malformed_header}.
 */
Options parse_options(std::string_view text, Options base = Options{});

// Read <git_dir>/config (defaults if the file is missing).
Options load_options(const std::filesystem::path& git_dir);

} // namespace gitpeek
