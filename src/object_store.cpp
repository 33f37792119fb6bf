#include "gitpeek/object_store.hpp"

#include "gitpeek/consts.hpp"
#include "gitpeek/error.hpp"
#include "gitpeek/fs.hpp"
#include "gitpeek/zstream.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace gfs = gitpeek::fs;

namespace gitpeek {

namespace {

// Decimal size from a loose header: digits only, no sign, no leading zeros.
std::uint64_t parse_header_size(std::string_view digits) {
  if (digits.empty()) {
    throw Error(Errc::malformed_header, "loose: empty object size");
  }
  if (digits.size() > 1 && digits.front() == '0') {
    throw Error(Errc::malformed_header, "loose: object size has leading zeros");
  }
  std::uint64_t v = 0;
  for (const char c : digits) {
    if (c < '0' || c > '9') {
      throw Error(Errc::malformed_header, "loose: bad object size '" + std::string(digits) + "'");
    }
    const auto d = static_cast<std::uint64_t>(c - '0');
    if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10) {
      throw Error(Errc::malformed_header, "loose: object size overflows");
    }
    v = (v * 10) + d;
  }
  return v;
}

} // namespace

DecodedObject decode_loose(std::span<const std::uint8_t> compressed) {
  auto store = zstream::inflate_all(compressed).data;

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw Error(Errc::malformed_header, "loose: header has no space");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw Error(Errc::malformed_header, "loose: header has no NUL terminator");
  }

  const std::string keyword(store.begin(), it_space);
  const auto type = parse_type_name(keyword);
  if (!type) {
    throw Error(Errc::malformed_header, "loose: unknown object type '" + keyword + "'");
  }
  const std::string digits(it_space + 1, it_nul);
  const std::uint64_t size = parse_header_size(digits);

  const auto payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  const std::size_t actual = store.size() - payload_off;
  if (actual != size) {
    throw Error(Errc::size_mismatch, "loose: header says " + std::to_string(size) +
                                         " bytes, payload has " + std::to_string(actual));
  }
  store.erase(store.begin(), store.begin() + static_cast<std::ptrdiff_t>(payload_off));
  return DecodedObject{.type = *type, .size = size, .data = std::move(store)};
}

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir = objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(const oid &object_id) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for_oid(object_id), ec);
}

DecodedObject ObjectStore::read(const oid &object_id) const {
  const auto path = path_for_oid(object_id);
  if (!contains(object_id)) {
    throw Error(Errc::not_found, "loose: no object " + to_hex(object_id));
  }
  try {
    return decode_loose(gfs::read_file(path));
  } catch (const Error &e) {
    throw Error(e.code(), to_hex(object_id) + ": " + e.what());
  }
}

std::vector<oid> ObjectStore::list() const {
  std::vector<oid> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(objects_dir_, ec)) {
    return out;
  }
  const std::size_t hexlen = hex_len(kind_);
  for (const auto &dir : std::filesystem::directory_iterator(objects_dir_, ec)) {
    const std::string prefix = dir.path().filename().string();
    if (prefix.size() != consts::kFanoutDirHexLen || !dir.is_directory()) {
      continue; // pack/, info/, ...
    }
    for (const auto &file : std::filesystem::directory_iterator(dir.path(), ec)) {
      const std::string hex = prefix + file.path().filename().string();
      oid id{};
      if (hex.size() != hexlen || !from_hex(hex, id)) {
        continue;
      }
      out.push_back(id);
    }
  }
  if (ec) {
    throw Error(Errc::io_error, "loose: cannot list " + objects_dir_.string() + ": " + ec.message());
  }
  std::ranges::sort(out);
  return out;
}

std::vector<oid> ObjectStore::match_prefix(std::string_view hex_prefix) const {
  std::vector<oid> out;
  if (hex_prefix.size() < consts::kFanoutDirHexLen || !looks_hex_prefix(hex_prefix)) {
    return out;
  }
  std::string want(hex_prefix);
  std::ranges::transform(want, want.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

  const auto dir = objects_dir_ / want.substr(0, consts::kFanoutDirHexLen);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return out;
  }
  const std::string rest = want.substr(consts::kFanoutDirHexLen);
  for (const auto &file : std::filesystem::directory_iterator(dir, ec)) {
    const std::string name = file.path().filename().string();
    if (!name.starts_with(rest)) {
      continue;
    }
    oid id{};
    const std::string hex = want.substr(0, consts::kFanoutDirHexLen) + name;
    if (hex.size() == hex_len(kind_) && from_hex(hex, id)) {
      out.push_back(id);
    }
  }
  std::ranges::sort(out);
  return out;
}

} // namespace gitpeek
