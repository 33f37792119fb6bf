#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace gitpeek {

// Values are the 3-bit type codes used in pack entry headers.
enum class ObjectType : std::uint8_t {
  commit = 1,
  tree = 2,
  blob = 3,
  tag = 4,
  ofs_delta = 6,
  ref_delta = 7,
};

// commit/tree/blob/tag; the delta kinds exist only inside packs.
[[nodiscard]] constexpr bool is_terminal(ObjectType type) {
  switch (type) {
  case ObjectType::commit:
  case ObjectType::tree:
  case ObjectType::blob:
  case ObjectType::tag:
    return true;
  case ObjectType::ofs_delta:
  case ObjectType::ref_delta:
    return false;
  }
  return false;
}

/** "blob", "ofs-delta", ... */
std::string_view type_name(ObjectType type);

// Parses the four terminal keywords only ("blob", "tree", "commit", "tag").
std::optional<ObjectType> parse_type_name(std::string_view name);

// Maps a 3-bit pack type code; 0 and 5 are reserved and yield nullopt.
std::optional<ObjectType> type_from_code(unsigned code);

struct DecodedObject {
  ObjectType type = ObjectType::blob; // always terminal
  std::uint64_t size = 0;             // == data.size()
  std::vector<std::uint8_t> data;     // payload bytes (no header)
};

} // namespace gitpeek
