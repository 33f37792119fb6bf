#include "gitpeek/pack.hpp"

#include "gitpeek/consts.hpp"
#include "gitpeek/error.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace gitpeek {

std::uint64_t decode_ofs_distance(ByteCursor &cur) {
  constexpr std::uint64_t kMaxBeforeShift = (std::numeric_limits<std::uint64_t>::max() >> 7U) - 1;
  std::uint8_t byte = cur.read_u8();
  std::uint64_t value = byte & 0x7FU;
  while ((byte & 0x80U) != 0) {
    if (value > kMaxBeforeShift) {
      throw Error(Errc::malformed_header, "pack: ofs-delta distance overflows 64 bits");
    }
    byte = cur.read_u8();
    value = ((value + 1) << 7U) | (byte & 0x7FU);
  }
  return value;
}

PackFile::PackFile(fs::FileImage image, std::filesystem::path path, HashKind kind)
    : image_(std::move(image)), path_(std::move(path)), kind_(kind) {}

PackFile PackFile::open(const std::filesystem::path &path, HashKind kind) {
  PackFile pack{fs::FileImage::map(path), path, kind};
  pack.parse_header();
  return pack;
}

PackFile PackFile::from_bytes(std::vector<std::uint8_t> bytes, HashKind kind) {
  PackFile pack{fs::FileImage::adopt(std::move(bytes)), "<memory>", kind};
  pack.parse_header();
  return pack;
}

void PackFile::parse_header() {
  const auto bytes = image_.bytes();
  const std::string where = "pack " + path_.string();
  if (bytes.size() < consts::kPackHeaderLen + raw_len(kind_)) {
    throw Error(Errc::out_of_bounds,
                where + ": " + std::to_string(bytes.size()) + " bytes is too short for a pack");
  }
  ByteCursor cur{bytes};
  const auto magic = cur.read_bytes(consts::kPackMagic.size());
  if (std::memcmp(magic.data(), consts::kPackMagic.data(), magic.size()) != 0) {
    throw Error(Errc::malformed_header, where + ": bad magic");
  }
  version_ = cur.read_u32_be();
  if (version_ != 2 && version_ != 3) {
    throw Error(Errc::malformed_header, where + ": unsupported version " + std::to_string(version_));
  }
  count_ = cur.read_u32_be();
  trailer_at_ = bytes.size() - raw_len(kind_);
}

PackEntry PackFile::read_entry(std::uint64_t offset) const {
  if (offset < consts::kPackHeaderLen || offset >= trailer_at_) {
    throw Error(Errc::out_of_bounds, "pack " + path_.string() + ": entry offset " +
                                         std::to_string(offset) + " outside object data");
  }
  const auto region = image_.bytes().subspan(offset, trailer_at_ - offset);
  ByteCursor cur{region};

  // 1TTTSSSS 1SSSSSSS ... 0SSSSSSS : type in bits 4-6, size 4 bits then 7 per byte
  std::uint8_t byte = cur.read_u8();
  const unsigned code = (byte >> 4U) & 0x7U;
  std::uint64_t size = byte & 0x0FU;
  unsigned shift = 4;
  while ((byte & 0x80U) != 0) {
    byte = cur.read_u8();
    const std::uint64_t chunk = byte & 0x7FU;
    if (shift >= 64 || (chunk >> (64 - shift)) != 0) {
      throw Error(Errc::malformed_header, "pack " + path_.string() + ": entry size overflows at " +
                                              std::to_string(offset));
    }
    size |= chunk << shift;
    shift += 7;
  }

  const auto type = type_from_code(code);
  if (!type) {
    throw Error(Errc::malformed_header, "pack " + path_.string() + ": invalid type code " +
                                            std::to_string(code) + " at " + std::to_string(offset));
  }

  PackEntry entry{.offset = offset, .type = *type, .size = size};
  switch (*type) {
  case ObjectType::commit:
  case ObjectType::tree:
  case ObjectType::blob:
  case ObjectType::tag:
    break;
  case ObjectType::ofs_delta: {
    const std::uint64_t distance = decode_ofs_distance(cur);
    if (distance == 0 || distance > offset - consts::kPackHeaderLen) {
      throw Error(Errc::malformed_header,
                  "pack " + path_.string() + ": ofs-delta at " + std::to_string(offset) +
                      " points " + std::to_string(distance) + " bytes back, outside the pack");
    }
    entry.base = OfsBase{.distance = distance, .offset = offset - distance};
    break;
  }
  case ObjectType::ref_delta:
    entry.base = oid{kind_, cur.read_bytes(raw_len(kind_))};
    break;
  }

  entry.header_len = cur.position();
  entry.compressed = cur.read_rest();
  return entry;
}

zstream::Inflated PackFile::inflate(const PackEntry &entry) const {
  try {
    return zstream::inflate_exact(entry.compressed, entry.size);
  } catch (const Error &e) {
    throw Error(e.code(), "pack " + path_.string() + ": entry at " +
                              std::to_string(entry.offset) + ": " + e.what());
  }
}

std::span<const std::uint8_t> PackFile::checksum() const {
  return image_.bytes().subspan(trailer_at_, raw_len(kind_));
}

void PackFile::verify_checksum() const {
  const oid actual = digest(kind_, image_.bytes().first(trailer_at_));
  if (!std::ranges::equal(actual.bytes(), checksum())) {
    throw Error(Errc::checksum_mismatch, "pack " + path_.string() + ": checksum mismatch");
  }
}

} // namespace gitpeek
