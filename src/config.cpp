#include "gitpeek/config.hpp"

#include "gitpeek/error.hpp"
#include "gitpeek/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <string>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string lower(std::string s) {
  std::ranges::transform(
      s, s.begin(), [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return s;
}

// Drop a trailing "# ..." / "; ..." comment that is not inside quotes.
std::string_view strip_comment(std::string_view sv) {
  bool quoted = false;
  for (std::size_t i = 0; i < sv.size(); ++i) {
    if (sv[i] == '"') {
      quoted = !quoted;
    } else if (!quoted && (sv[i] == '#' || sv[i] == ';')) {
      return sv.substr(0, i);
    }
  }
  return sv;
}

std::string unquote(std::string v) {
  if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

bool parse_bool(const std::string &key, const std::string &value) {
  const std::string v = lower(value);
  if (v == "true" || v == "yes" || v == "on" || v == "1") {
    return true;
  }
  if (v == "false" || v == "no" || v == "off" || v == "0") {
    return false;
  }
  throw gitpeek::Error(gitpeek::Errc::malformed_header,
                       "config: " + key + ": not a boolean: '" + value + "'");
}

} // namespace

namespace gitpeek {

Options parse_options(std::string_view text, Options base) {
  Options out = base;
  std::istringstream iss{std::string(text)};

  std::string section;
  std::string line;
  while (std::getline(iss, line)) {
    const std::string sv = trim(strip_comment(line));
    if (sv.empty())
      continue; // blank or comment-only

    if (sv.front() == '[') {
      const auto close = sv.find(']');
      if (close == std::string::npos) {
        throw Error(Errc::malformed_header, "config: unterminated section header: " + sv);
      }
      // [remote "origin"] -> "remote"; subsections are not used here
      std::string name = trim(std::string_view(sv).substr(1, close - 1));
      if (const auto sp = name.find_first_of(" \t"); sp != std::string::npos) {
        name.resize(sp);
      }
      section = lower(name);
      continue;
    }

    std::string key;
    std::string value;
    if (const auto eq = sv.find('='); eq == std::string::npos) {
      key = lower(trim(sv));
      value = "true"; // bare key means true in git-config
    } else {
      key = lower(trim(std::string_view(sv).substr(0, eq)));
      value = unquote(trim(std::string_view(sv).substr(eq + 1)));
    }
    const std::string full = section + "." + key;

    if (full == "extensions.objectformat") {
      const std::string v = lower(value);
      if (v == "sha1") {
        out.hash_kind = HashKind::sha1;
      } else if (v == "sha256") {
        out.hash_kind = HashKind::sha256;
      } else {
        throw Error(Errc::malformed_header, "config: " + full + ": unknown format '" + value + "'");
      }
    } else if (full == "gitpeek.maxdeltadepth") {
      std::size_t n = 0;
      const auto *first = value.data();
      const auto *last = value.data() + value.size();
      const auto [ptr, ec] = std::from_chars(first, last, n);
      if (ec != std::errc{} || ptr != last || n == 0) {
        throw Error(Errc::malformed_header,
                    "config: " + full + ": expected a positive integer, got '" + value + "'");
      }
      out.max_delta_depth = n;
    } else if (full == "gitpeek.verifyobjects") {
      out.verify_objects = parse_bool(full, value);
    }
  }
  return out;
}

Options load_options(const std::filesystem::path &git_dir) {
  const auto path = git_dir / consts::kConfigFile;
  if (!fs::exists(path))
    return Options{};

  const auto bytes = fs::read_file(path);
  return parse_options(std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

} // namespace gitpeek
