#pragma once
#include "gitpeek/hash.hpp"
#include "gitpeek/object.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace gitpeek {

/**
 * Decode the raw (still compressed) bytes of a loose object file:
 *   zlib("<type> <decimal size>\\0" + payload)
 * Throws Error{malformed_header | size_mismatch | decompression_failure}.
 */
DecodedObject decode_loose(std::span<const std::uint8_t> compressed);

// Read-only view of the loose half of an object database (objects/xx/yyyy...).
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir, HashKind kind = HashKind::sha1)
    : objects_dir_(std::move(objects_dir)), kind_(kind) {}

  [[nodiscard]] const std::filesystem::path& objects_dir() const { return objects_dir_; }
  [[nodiscard]] HashKind hash_kind() const { return kind_; }

  // Get filesystem path for a binary oid.
  [[nodiscard]] std::filesystem::path path_for_oid(const oid& object_id) const;

  [[nodiscard]] bool contains(const oid& object_id) const;

  // Read and decode; throws Error{not_found} if there is no loose file for the id.
  [[nodiscard]] DecodedObject read(const oid& object_id) const;

  // Every loose object id, sorted. Stray files with non-hex names are skipped.
  [[nodiscard]] std::vector<oid> list() const;

  // Loose ids whose hex form starts with `hex_prefix` (at least 2 chars).
  [[nodiscard]] std::vector<oid> match_prefix(std::string_view hex_prefix) const;

private:
  std::filesystem::path objects_dir_;
  HashKind kind_;
};

} // namespace gitpeek
