#pragma once
#include "gitpeek/byte_cursor.hpp"
#include "gitpeek/fs.hpp"
#include "gitpeek/hash.hpp"
#include "gitpeek/object.hpp"
#include "gitpeek/zstream.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <variant>
#include <vector>

namespace gitpeek {

// Base of an ofs-delta: `distance` bytes back from the delta's own offset.
struct OfsBase {
  std::uint64_t distance = 0;
  std::uint64_t offset = 0; // entry offset - distance
};

// monostate for whole objects, the base id for ref-delta, OfsBase for ofs-delta.
using BaseRef = std::variant<std::monostate, oid, OfsBase>;

/**
 * One raw entry as stored in a pack, not yet inflated or resolved.
 * `compressed` views the shared pack image from the start of the zlib stream
 * up to the pack trailer; the stream itself ends somewhere inside it.
 */
struct PackEntry {
  std::uint64_t offset = 0;
  ObjectType type = ObjectType::blob;
  std::uint64_t size = 0; // inflated size (for deltas: size of the delta stream)
  BaseRef base;
  std::size_t header_len = 0;
  std::span<const std::uint8_t> compressed;
};

/**
 * Backward distance of an ofs-delta base. Groups of 7 bits, most significant
 * first; every continuation adds one before shifting:
 *   v = b0 & 0x7f;  while (b & 0x80) { b = next; v = ((v + 1) << 7) | (b & 0x7f); }
 * The +1 makes every encoding length cover a disjoint range, so 0x80 0x00 is 128.
 */
std::uint64_t decode_ofs_distance(ByteCursor& cur);

class PackFile {
public:
  static PackFile open(const std::filesystem::path& path, HashKind kind = HashKind::sha1);
  static PackFile from_bytes(std::vector<std::uint8_t> bytes, HashKind kind = HashKind::sha1);

  [[nodiscard]] std::uint32_t version() const { return version_; }
  [[nodiscard]] std::uint32_t object_count() const { return count_; }
  [[nodiscard]] HashKind hash_kind() const { return kind_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  // Offset where entry data stops and the trailing checksum begins.
  [[nodiscard]] std::uint64_t data_end() const { return trailer_at_; }

  // Parse the entry header at `offset`. Throws Error{out_of_bounds | malformed_header}.
  [[nodiscard]] PackEntry read_entry(std::uint64_t offset) const;

  // Inflate an entry's zlib stream; must yield exactly entry.size bytes.
  [[nodiscard]] zstream::Inflated inflate(const PackEntry& entry) const;

  // Trailing whole-file checksum.
  [[nodiscard]] std::span<const std::uint8_t> checksum() const;

  // Recompute the trailing checksum. Throws Error{checksum_mismatch}.
  void verify_checksum() const;

private:
  PackFile(fs::FileImage image, std::filesystem::path path, HashKind kind);
  void parse_header();

  fs::FileImage image_;
  std::filesystem::path path_;
  HashKind kind_;
  std::uint32_t version_ = 0;
  std::uint32_t count_ = 0;
  std::size_t trailer_at_ = 0;
};

} // namespace gitpeek
