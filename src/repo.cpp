#include "gitpeek/repo.hpp"

#include "gitpeek/error.hpp"
#include "gitpeek/fs.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace stdfs = std::filesystem;
namespace gfs   = gitpeek::fs;

namespace {

[[nodiscard]] auto looks_like_git_dir(const stdfs::path &dir) -> bool {
  std::error_code ec;
  return stdfs::is_directory(dir / gitpeek::consts::kObjectsDir, ec) &&
         stdfs::exists(dir / "HEAD", ec);
}

// Follow a ".git" file of the form "gitdir: <path>"; relative paths are relative to the file.
[[nodiscard]] auto read_gitdir_file(const stdfs::path &file) -> stdfs::path {
  const auto bytes = gfs::read_file(file);
  std::string text(bytes.begin(), bytes.end());
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    text.pop_back();
  if (!text.starts_with(gitpeek::consts::kGitdirLinePrefix)) {
    throw gitpeek::Error(gitpeek::Errc::malformed_header,
                         "repo: " + file.string() + " is not a gitdir link");
  }
  stdfs::path target = text.substr(gitpeek::consts::kGitdirLinePrefix.size());
  if (target.is_relative()) {
    target = file.parent_path() / target;
  }
  return target.lexically_normal();
}

} // namespace

namespace gitpeek {

Repository Repository::discover(const stdfs::path &start) {
  std::error_code ec;
  stdfs::path dir = stdfs::absolute(start, ec);
  if (ec) {
    throw Error(Errc::io_error, "repo: cannot resolve " + start.string() + ": " + ec.message());
  }

  for (;;) {
    const stdfs::path dotgit = dir / consts::kGitDir;
    if (stdfs::is_directory(dotgit, ec) && looks_like_git_dir(dotgit)) {
      return Repository{dotgit};
    }
    if (stdfs::is_regular_file(dotgit, ec)) {
      const auto target = read_gitdir_file(dotgit);
      if (looks_like_git_dir(target)) {
        return Repository{target};
      }
    }
    if (looks_like_git_dir(dir)) {
      return Repository{dir};
    }
    if (!dir.has_parent_path() || dir.parent_path() == dir) {
      break;
    }
    dir = dir.parent_path();
  }
  throw Error(Errc::not_found, "repo: no git repository at or above " + start.string());
}

std::vector<PackPair> Repository::packs() const {
  std::vector<PackPair> out;
  std::error_code ec;
  const auto dir = pack_dir();
  if (!stdfs::is_directory(dir, ec)) {
    return out;
  }
  for (const auto &entry : stdfs::directory_iterator(dir, ec)) {
    const auto &path = entry.path();
    if (path.extension().string() != consts::kPackExt) {
      continue;
    }
    auto idx = path;
    idx.replace_extension(consts::kIndexExt);
    if (gfs::exists(idx)) {
      out.push_back(PackPair{.pack = path, .index = std::move(idx)});
    }
  }
  if (ec) {
    throw Error(Errc::io_error, "repo: cannot list " + dir.string() + ": " + ec.message());
  }
  std::ranges::sort(out, [](const PackPair &a, const PackPair &b) { return a.pack < b.pack; });
  return out;
}

} // namespace gitpeek
