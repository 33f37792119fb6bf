#include "gitpeek/object.hpp"

#include "gitpeek/consts.hpp"

namespace gitpeek {

std::string_view type_name(ObjectType type) {
  switch (type) {
  case ObjectType::commit:
    return consts::kTypeCommit;
  case ObjectType::tree:
    return consts::kTypeTree;
  case ObjectType::blob:
    return consts::kTypeBlob;
  case ObjectType::tag:
    return consts::kTypeTag;
  case ObjectType::ofs_delta:
    return "ofs-delta";
  case ObjectType::ref_delta:
    return "ref-delta";
  }
  return "unknown";
}

std::optional<ObjectType> parse_type_name(std::string_view name) {
  if (name == consts::kTypeBlob) {
    return ObjectType::blob;
  }
  if (name == consts::kTypeTree) {
    return ObjectType::tree;
  }
  if (name == consts::kTypeCommit) {
    return ObjectType::commit;
  }
  if (name == consts::kTypeTag) {
    return ObjectType::tag;
  }
  return std::nullopt;
}

std::optional<ObjectType> type_from_code(unsigned code) {
  switch (code) {
  case 1:
  case 2:
  case 3:
  case 4:
  case 6:
  case 7:
    return static_cast<ObjectType>(code);
  default:
    return std::nullopt;
  }
}

} // namespace gitpeek
