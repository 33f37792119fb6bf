#include "gitpeek/pack_index.hpp"

#include "gitpeek/byte_cursor.hpp"
#include "gitpeek/consts.hpp"
#include "gitpeek/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>

namespace gitpeek {

namespace {

std::uint32_t load_be32(std::span<const std::uint8_t> b, std::size_t pos) {
  return (static_cast<std::uint32_t>(b[pos]) << 24U) |
         (static_cast<std::uint32_t>(b[pos + 1]) << 16U) |
         (static_cast<std::uint32_t>(b[pos + 2]) << 8U) | static_cast<std::uint32_t>(b[pos + 3]);
}

std::uint64_t load_be64(std::span<const std::uint8_t> b, std::size_t pos) {
  return (static_cast<std::uint64_t>(load_be32(b, pos)) << 32U) | load_be32(b, pos + 4);
}

bool has_v2_magic(std::span<const std::uint8_t> b) {
  return b.size() >= consts::kIndexMagic.size() &&
         std::memcmp(b.data(), consts::kIndexMagic.data(), consts::kIndexMagic.size()) == 0;
}

} // namespace

PackIndex::PackIndex(fs::FileImage image, std::filesystem::path path, HashKind kind)
    : image_(std::move(image)), path_(std::move(path)), kind_(kind) {}

PackIndex PackIndex::open(const std::filesystem::path &path, HashKind kind) {
  PackIndex idx{fs::FileImage::map(path), path, kind};
  idx.parse();
  return idx;
}

PackIndex PackIndex::from_bytes(std::vector<std::uint8_t> bytes, HashKind kind) {
  PackIndex idx{fs::FileImage::adopt(std::move(bytes)), "<memory>", kind};
  idx.parse();
  return idx;
}

void PackIndex::parse() {
  const auto bytes = image_.bytes();
  const std::size_t hlen = raw_len(kind_);
  const std::string where = "pack index " + path_.string();

  ByteCursor cur{bytes};
  if (has_v2_magic(bytes)) {
    cur.skip(consts::kIndexMagic.size());
    version_ = cur.read_u32_be();
    if (version_ != consts::kIndexVersion2) {
      throw Error(Errc::index_version_unsupported,
                  where + ": unsupported version " + std::to_string(version_));
    }
  } else {
    version_ = 1;
  }

  std::uint32_t prev = 0;
  for (std::size_t i = 0; i < consts::kFanoutEntries; ++i) {
    fanout_[i] = cur.read_u32_be();
    if (fanout_[i] < prev) {
      throw Error(Errc::malformed_header,
                  where + ": fanout table decreases at bucket " + std::to_string(i));
    }
    prev = fanout_[i];
  }
  count_ = fanout_[consts::kFanoutEntries - 1];
  const std::size_t tables_at = cur.position();
  const std::size_t trailer_len = 2 * hlen;

  if (version_ == 1) {
    record_stride_ = 4 + hlen;
    offsets_at_ = tables_at;
    hashes_at_ = tables_at + 4;
    trailer_at_ = tables_at + (count_ * record_stride_);
    if (bytes.size() < trailer_at_ + trailer_len) {
      throw Error(Errc::out_of_bounds, where + ": truncated v1 index for " +
                                           std::to_string(count_) + " entries");
    }
    if (bytes.size() != trailer_at_ + trailer_len) {
      throw Error(Errc::malformed_header, where + ": trailing garbage after v1 index");
    }
    return;
  }

  record_stride_ = hlen;
  hashes_at_ = tables_at;
  crc_at_ = hashes_at_ + (count_ * hlen);
  offsets_at_ = crc_at_ + (count_ * 4);
  large_at_ = offsets_at_ + (count_ * 4);
  if (bytes.size() < large_at_ + trailer_len) {
    throw Error(Errc::out_of_bounds,
                where + ": truncated v2 index for " + std::to_string(count_) + " entries");
  }
  const std::size_t large_bytes = bytes.size() - large_at_ - trailer_len;
  if (large_bytes % 8 != 0 || large_bytes / 8 > count_) {
    throw Error(Errc::malformed_header, where + ": bad 64-bit offset table size");
  }
  large_count_ = large_bytes / 8;
  trailer_at_ = large_at_ + large_bytes;
}

std::span<const std::uint8_t> PackIndex::hash_at(std::size_t i) const {
  return image_.bytes().subspan(hashes_at_ + (i * record_stride_), raw_len(kind_));
}

std::uint64_t PackIndex::offset_at(std::size_t i) const {
  const auto bytes = image_.bytes();
  if (version_ == 1) {
    return load_be32(bytes, offsets_at_ + (i * record_stride_));
  }
  const std::uint32_t word = load_be32(bytes, offsets_at_ + (i * 4));
  if ((word & consts::kLargeOffsetFlag) == 0) {
    return word;
  }
  // Offsets past 2^31 live in the 64-bit table; never truncate them.
  const std::size_t slot = word & ~consts::kLargeOffsetFlag;
  if (slot >= large_count_) {
    throw Error(Errc::out_of_bounds, "pack index " + path_.string() + ": large offset slot " +
                                         std::to_string(slot) + " past table of " +
                                         std::to_string(large_count_));
  }
  return load_be64(bytes, large_at_ + (slot * 8));
}

std::pair<std::size_t, std::size_t> PackIndex::fanout_range(std::uint8_t first) const {
  const std::size_t hi = fanout_[first];
  const std::size_t lo = first == 0 ? 0 : fanout_[first - 1];
  return {lo, hi};
}

std::optional<std::uint64_t> PackIndex::find(const oid &id) const {
  if (id.kind() != kind_) {
    return std::nullopt;
  }
  auto [lo, hi] = fanout_range(id[0]);
  const auto want = id.bytes();
  while (lo < hi) {
    const std::size_t mid = lo + ((hi - lo) / 2);
    const int cmp = std::memcmp(hash_at(mid).data(), want.data(), want.size());
    if (cmp == 0) {
      return offset_at(mid);
    }
    if (cmp < 0) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return std::nullopt;
}

std::uint64_t PackIndex::lookup(const oid &id) const {
  if (auto off = find(id)) {
    return *off;
  }
  throw Error(Errc::not_found, "pack index " + path_.string() + ": no entry for " + to_hex(id));
}

PackIndexEntry PackIndex::entry(std::size_t i) const {
  if (i >= count_) {
    throw Error(Errc::out_of_bounds, "pack index " + path_.string() + ": entry " +
                                         std::to_string(i) + " of " + std::to_string(count_));
  }
  PackIndexEntry e{.id = oid{kind_, hash_at(i)}, .offset = offset_at(i), .crc32 = std::nullopt};
  if (version_ >= consts::kIndexVersion2) {
    e.crc32 = load_be32(image_.bytes(), crc_at_ + (i * 4));
  }
  return e;
}

std::vector<oid> PackIndex::match_prefix(std::string_view hex_prefix) const {
  std::vector<oid> out;
  if (hex_prefix.size() < 2 || hex_prefix.size() > hex_len(kind_) ||
      !looks_hex_prefix(hex_prefix)) {
    return out;
  }
  std::string want(hex_prefix);
  std::ranges::transform(want, want.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  const auto first = static_cast<std::uint8_t>(std::stoul(want.substr(0, 2), nullptr, 16));
  const auto [lo, hi] = fanout_range(first);
  for (std::size_t i = lo; i < hi; ++i) {
    const oid id{kind_, hash_at(i)};
    if (to_hex(id).starts_with(want)) {
      out.push_back(id);
    }
  }
  return out;
}

std::span<const std::uint8_t> PackIndex::pack_checksum() const {
  return image_.bytes().subspan(trailer_at_, raw_len(kind_));
}

void PackIndex::verify_checksum() const {
  const auto bytes = image_.bytes();
  const std::size_t hlen = raw_len(kind_);
  const auto body = bytes.first(bytes.size() - hlen);
  const auto stored = bytes.last(hlen);
  const oid actual = digest(kind_, body);
  if (!std::ranges::equal(actual.bytes(), stored)) {
    throw Error(Errc::checksum_mismatch, "pack index " + path_.string() + ": checksum mismatch");
  }
}

} // namespace gitpeek
