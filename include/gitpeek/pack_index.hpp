#pragma once
#include "gitpeek/fs.hpp"
#include "gitpeek/hash.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace gitpeek {

struct PackIndexEntry {
  oid id;
  std::uint64_t offset = 0;           // byte offset of the entry in the .pack
  std::optional<std::uint32_t> crc32; // CRC of the compressed entry (v2 only)
};

/**
 * Parsed *.idx file, immutable after load.
 *
 * v1: fanout[256] then count x {u32 offset, hash}
 * v2: "\377tOc", u32 2, fanout[256], hashes[count], crc32[count],
 *     offsets[count] (high bit => index into the 64-bit table), u64 large[]
 * Both end with <pack checksum><index checksum>.
 *
 * The tables are read in place from the mapped image; nothing is copied.
 */
class PackIndex {
public:
  static PackIndex open(const std::filesystem::path& path, HashKind kind = HashKind::sha1);
  static PackIndex from_bytes(std::vector<std::uint8_t> bytes, HashKind kind = HashKind::sha1);

  [[nodiscard]] std::uint32_t version() const { return version_; }
  [[nodiscard]] HashKind hash_kind() const { return kind_; }
  [[nodiscard]] std::size_t size() const { return count_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // Offset of `id` in the companion pack, or nullopt if the index does not list it.
  [[nodiscard]] std::optional<std::uint64_t> find(const oid& id) const;

  // Same as find() but throws Error{not_found}.
  [[nodiscard]] std::uint64_t lookup(const oid& id) const;

  // i-th entry in hash order, 0 <= i < size().
  [[nodiscard]] PackIndexEntry entry(std::size_t i) const;

  // Entries whose hex id starts with `hex_prefix` (case-insensitive, at least 2 chars).
  [[nodiscard]] std::vector<oid> match_prefix(std::string_view hex_prefix) const;

  // Pack checksum recorded in the trailer; must match the .pack's own trailer.
  [[nodiscard]] std::span<const std::uint8_t> pack_checksum() const;

  // Recompute the trailing index checksum. Throws Error{checksum_mismatch}.
  void verify_checksum() const;

private:
  PackIndex(fs::FileImage image, std::filesystem::path path, HashKind kind);
  void parse();

  [[nodiscard]] std::span<const std::uint8_t> hash_at(std::size_t i) const;
  [[nodiscard]] std::uint64_t offset_at(std::size_t i) const;
  // [lo, hi) range of entries whose first hash byte is `first`.
  [[nodiscard]] std::pair<std::size_t, std::size_t> fanout_range(std::uint8_t first) const;

  fs::FileImage image_;
  std::filesystem::path path_;
  HashKind kind_;
  std::uint32_t version_ = 1;
  std::size_t count_ = 0;
  std::array<std::uint32_t, 256> fanout_{};

  // Table positions inside image_ (bytes from the start of the file).
  std::size_t hashes_at_ = 0;
  std::size_t record_stride_ = 0; // v1: 4 + hash len; v2: hash len
  std::size_t crc_at_ = 0;
  std::size_t offsets_at_ = 0;
  std::size_t large_at_ = 0;
  std::size_t large_count_ = 0;
  std::size_t trailer_at_ = 0;
};

} // namespace gitpeek
