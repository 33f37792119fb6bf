#pragma once

#include "gitpeek/consts.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gitpeek {

enum class HashKind : std::uint8_t { sha1, sha256 };

[[nodiscard]] constexpr std::size_t raw_len(HashKind kind) {
  return kind == HashKind::sha256 ? consts::kSha256RawLen : consts::kSha1RawLen;
}

[[nodiscard]] constexpr std::size_t hex_len(HashKind kind) { return 2 * raw_len(kind); }

std::string_view hash_kind_name(HashKind kind);

/**
 * Binary object id (not hex). Holds either a 20-byte SHA-1 or a 32-byte SHA-256;
 * unused trailing bytes stay zero so defaulted comparison is well defined.
 */
class oid {
public:
  oid() = default;

  // Throws Error{out_of_bounds} if raw.size() != raw_len(kind).
  oid(HashKind kind, std::span<const std::uint8_t> raw);

  [[nodiscard]] HashKind kind() const { return kind_; }
  [[nodiscard]] std::size_t size() const { return raw_len(kind_); }
  [[nodiscard]] std::span<const std::uint8_t> bytes() const { return {bytes_.data(), size()}; }
  [[nodiscard]] std::uint8_t operator[](std::size_t i) const { return bytes_[i]; }

  friend auto operator<=>(const oid &, const oid &) = default;
  friend bool operator==(const oid &, const oid &) = default;

private:
  std::array<std::uint8_t, consts::kMaxRawLen> bytes_{};
  HashKind kind_ = HashKind::sha1;
};

/** Digest arbitrary bytes with the algorithm named by `kind`. */
oid digest(HashKind kind, std::span<const std::uint8_t> data);

/**
 * Compute the id git assigns an object:
 *   H("<type> <size>\\0" + payload)
 */
oid object_id(HashKind kind, std::string_view type, std::span<const std::uint8_t> payload);

/** Convert binary oid to lowercase hex (40 or 64 chars). */
std::string to_hex(const oid &id);

/**
 * Parse a full 40- or 64-char hex id; the length picks the hash kind.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

// True if every character is a hex digit and the length is at most a full SHA-256 id.
bool looks_hex_prefix(std::string_view str);

/**
 * Build the Git object header used for hashing:
 *   "<type> <size>\\0"
 */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1); // rough reserve
  s.append(type);
  s.push_back(consts::kSpace);
  s.append(std::to_string(size));
  s.push_back(consts::kNul);
  return s;
}

} // namespace gitpeek
