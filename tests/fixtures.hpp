#pragma once
// Builders for on-disk formats used by the tests. Nothing here is linked into gitpeek itself.

#include "gitpeek/error.hpp"
#include "gitpeek/hash.hpp"
#include "gitpeek/object.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <zlib.h>

namespace fixtures {

using Bytes = std::vector<std::uint8_t>;

inline Bytes bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

inline std::string text(std::span<const std::uint8_t> b) { return std::string(b.begin(), b.end()); }

inline void append(Bytes &out, std::span<const std::uint8_t> more) {
  out.insert(out.end(), more.begin(), more.end());
}

inline void put_be32(Bytes &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

inline void put_be64(Bytes &out, std::uint64_t v) {
  put_be32(out, static_cast<std::uint32_t>(v >> 32));
  put_be32(out, static_cast<std::uint32_t>(v));
}

inline Bytes zlib_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  Bytes out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

// Contents of a loose object file.
inline Bytes loose_file(std::string_view type, std::span<const std::uint8_t> payload) {
  const std::string hdr = gitpeek::object_header(type, payload.size());
  Bytes raw(hdr.begin(), hdr.end());
  append(raw, payload);
  return zlib_compress(raw);
}

// Size varint used in delta headers: 7 bits per byte, low group first.
inline Bytes encode_varint(std::uint64_t n) {
  Bytes out;
  do {
    std::uint8_t b = n & 0x7F;
    n >>= 7;
    if (n != 0)
      b |= 0x80;
    out.push_back(b);
  } while (n != 0);
  return out;
}

// Backward distance of an ofs-delta, written the way git's pack writer does.
inline Bytes encode_ofs_distance(std::uint64_t ofs) {
  std::uint8_t buf[16];
  std::size_t pos = sizeof(buf) - 1;
  buf[pos] = ofs & 127;
  while (ofs >>= 7)
    buf[--pos] = static_cast<std::uint8_t>(128 | (--ofs & 127));
  return Bytes(buf + pos, buf + sizeof(buf));
}

// Pack entry header: type in bits 4-6 of the first byte, size 4 + 7n bits.
inline Bytes entry_header(unsigned type_code, std::uint64_t size) {
  Bytes out;
  std::uint8_t b = static_cast<std::uint8_t>((type_code << 4) | (size & 0x0F));
  size >>= 4;
  while (size != 0) {
    out.push_back(b | 0x80);
    b = size & 0x7F;
    size >>= 7;
  }
  out.push_back(b);
  return out;
}

// ——— delta encoding (reference generator, not production code) ———

inline void emit_copy(Bytes &out, std::uint64_t offset, std::uint64_t len) {
  while (len > 0) {
    const std::uint64_t chunk = std::min<std::uint64_t>(len, 0x10000);
    std::uint8_t op = 0x80;
    Bytes args;
    for (unsigned i = 0; i < 4; ++i) {
      const auto b = static_cast<std::uint8_t>(offset >> (8 * i));
      if (b != 0) {
        op |= static_cast<std::uint8_t>(1U << i);
        args.push_back(b);
      }
    }
    // 0x10000 is encoded by leaving every size byte out
    const std::uint64_t size = chunk == 0x10000 ? 0 : chunk;
    for (unsigned i = 0; i < 3; ++i) {
      const auto b = static_cast<std::uint8_t>(size >> (8 * i));
      if (b != 0) {
        op |= static_cast<std::uint8_t>(0x10U << i);
        args.push_back(b);
      }
    }
    out.push_back(op);
    append(out, args);
    offset += chunk;
    len -= chunk;
  }
}

inline void emit_insert(Bytes &out, std::span<const std::uint8_t> lit) {
  while (!lit.empty()) {
    const std::size_t n = std::min<std::size_t>(lit.size(), 127);
    out.push_back(static_cast<std::uint8_t>(n));
    append(out, lit.first(n));
    lit = lit.subspan(n);
  }
}

// Greedy matcher over 4-byte anchors of the base. Correct for any inputs, not compact.
inline Bytes make_delta(std::span<const std::uint8_t> base, std::span<const std::uint8_t> target) {
  constexpr std::size_t kAnchor = 4;
  Bytes out = encode_varint(base.size());
  append(out, encode_varint(target.size()));

  auto key = [](std::span<const std::uint8_t> s, std::size_t at) {
    return (std::uint32_t{s[at]} << 24) | (std::uint32_t{s[at + 1]} << 16) |
           (std::uint32_t{s[at + 2]} << 8) | std::uint32_t{s[at + 3]};
  };
  std::unordered_map<std::uint32_t, std::size_t> anchors;
  for (std::size_t i = 0; i + kAnchor <= base.size(); ++i) {
    anchors.emplace(key(base, i), i);
  }

  std::size_t i = 0;
  std::size_t lit_start = 0;
  while (i < target.size()) {
    std::size_t best_len = 0;
    std::size_t best_at = 0;
    if (i + kAnchor <= target.size()) {
      if (auto it = anchors.find(key(target, i)); it != anchors.end()) {
        std::size_t len = 0;
        while (it->second + len < base.size() && i + len < target.size() &&
               base[it->second + len] == target[i + len])
          ++len;
        best_len = len;
        best_at = it->second;
      }
    }
    if (best_len >= kAnchor) {
      emit_insert(out, target.subspan(lit_start, i - lit_start));
      emit_copy(out, best_at, best_len);
      i += best_len;
      lit_start = i;
    } else {
      ++i;
    }
  }
  emit_insert(out, target.subspan(lit_start, target.size() - lit_start));
  return out;
}

// ——— pack and index writers ———

struct IndexRecord {
  gitpeek::oid id;
  std::uint64_t offset = 0;
  std::uint32_t crc = 0;
};

inline void append_trailer(Bytes &file, gitpeek::HashKind kind) {
  const auto sum = gitpeek::digest(kind, file);
  append(file, sum.bytes());
}

// v2 index; offsets at or above 2^31 go to the 64-bit table.
inline Bytes index_v2(std::vector<IndexRecord> recs, std::span<const std::uint8_t> pack_sum,
                      gitpeek::HashKind kind = gitpeek::HashKind::sha1) {
  std::ranges::sort(recs, [](const IndexRecord &a, const IndexRecord &b) { return a.id < b.id; });
  Bytes out = {0xFF, 't', 'O', 'c'};
  put_be32(out, 2);
  std::uint32_t counts[256] = {};
  for (const auto &r : recs)
    ++counts[r.id[0]];
  std::uint32_t running = 0;
  for (std::uint32_t c : counts) {
    running += c;
    put_be32(out, running);
  }
  for (const auto &r : recs)
    append(out, r.id.bytes());
  for (const auto &r : recs)
    put_be32(out, r.crc);
  Bytes large;
  std::uint32_t next_large = 0;
  for (const auto &r : recs) {
    if (r.offset >= 0x80000000ULL) {
      put_be32(out, 0x80000000U | next_large++);
      put_be64(large, r.offset);
    } else {
      put_be32(out, static_cast<std::uint32_t>(r.offset));
    }
  }
  append(out, large);
  append(out, pack_sum);
  append_trailer(out, kind);
  return out;
}

inline Bytes index_v1(std::vector<IndexRecord> recs, std::span<const std::uint8_t> pack_sum,
                      gitpeek::HashKind kind = gitpeek::HashKind::sha1) {
  std::ranges::sort(recs, [](const IndexRecord &a, const IndexRecord &b) { return a.id < b.id; });
  Bytes out;
  std::uint32_t counts[256] = {};
  for (const auto &r : recs)
    ++counts[r.id[0]];
  std::uint32_t running = 0;
  for (std::uint32_t c : counts) {
    running += c;
    put_be32(out, running);
  }
  for (const auto &r : recs) {
    put_be32(out, static_cast<std::uint32_t>(r.offset));
    append(out, r.id.bytes());
  }
  append(out, pack_sum);
  append_trailer(out, kind);
  return out;
}

// Assembles a pack in memory; each add_* returns the entry's offset.
class PackBuilder {
public:
  explicit PackBuilder(gitpeek::HashKind kind = gitpeek::HashKind::sha1) : kind_(kind) {}

  std::uint64_t add_object(gitpeek::ObjectType type, std::span<const std::uint8_t> payload) {
    Bytes entry = entry_header(static_cast<unsigned>(type), payload.size());
    append(entry, zlib_compress(payload));
    return add_raw(std::move(entry),
                   gitpeek::object_id(kind_, gitpeek::type_name(type), payload));
  }

  // `id` is the id of the object the delta produces.
  std::uint64_t add_ofs_delta(std::uint64_t base_offset, std::span<const std::uint8_t> delta,
                              const gitpeek::oid &id) {
    const std::uint64_t at = next_offset();
    Bytes entry = entry_header(6, delta.size());
    append(entry, encode_ofs_distance(at - base_offset));
    append(entry, zlib_compress(delta));
    return add_raw(std::move(entry), id);
  }

  std::uint64_t add_ref_delta(const gitpeek::oid &base, std::span<const std::uint8_t> delta,
                              const gitpeek::oid &id) {
    Bytes entry = entry_header(7, delta.size());
    append(entry, base.bytes());
    append(entry, zlib_compress(delta));
    return add_raw(std::move(entry), id);
  }

  // Arbitrary (possibly corrupt) entry bytes.
  std::uint64_t add_raw(Bytes entry, const gitpeek::oid &id) {
    const std::uint64_t at = next_offset();
    const auto crc = static_cast<std::uint32_t>(
        crc32(0L, entry.data(), static_cast<uInt>(entry.size())));
    records_.push_back(IndexRecord{.id = id, .offset = at, .crc = crc});
    append(body_, entry);
    return at;
  }

  [[nodiscard]] std::uint64_t next_offset() const { return 12 + body_.size(); }
  [[nodiscard]] const std::vector<IndexRecord> &records() const { return records_; }

  [[nodiscard]] Bytes pack() const {
    Bytes out = {'P', 'A', 'C', 'K'};
    put_be32(out, 2);
    put_be32(out, static_cast<std::uint32_t>(records_.size()));
    append(out, body_);
    append_trailer(out, kind_);
    return out;
  }

  [[nodiscard]] Bytes index(unsigned version = 2) const {
    const Bytes p = pack();
    const auto sum = std::span<const std::uint8_t>(p).last(gitpeek::raw_len(kind_));
    return version == 1 ? index_v1(records_, sum, kind_) : index_v2(records_, sum, kind_);
  }

private:
  gitpeek::HashKind kind_;
  Bytes body_;
  std::vector<IndexRecord> records_;
};

// ——— temp directories and repositories ———

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(std::string_view tag)
      : path_(std::filesystem::temp_directory_path() /
              ("gitpeek_" + std::string(tag) + "_" + std::to_string(std::random_device{}()))) {
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!ofs)
    throw std::runtime_error("write failed: " + p.string());
}

// Minimal work tree layout: <root>/.git/{HEAD,objects/pack}.
inline std::filesystem::path init_repo(const std::filesystem::path &root) {
  const auto git = root / ".git";
  std::filesystem::create_directories(git / "objects" / "pack");
  const Bytes head = bytes("ref: refs/heads/master\n");
  write_file(git / "HEAD", head);
  return git;
}

inline gitpeek::oid write_loose(const std::filesystem::path &objects_dir, gitpeek::ObjectType type,
                                std::span<const std::uint8_t> payload,
                                gitpeek::HashKind kind = gitpeek::HashKind::sha1) {
  const auto id = gitpeek::object_id(kind, gitpeek::type_name(type), payload);
  const std::string hex = gitpeek::to_hex(id);
  write_file(objects_dir / hex.substr(0, 2) / hex.substr(2),
             loose_file(gitpeek::type_name(type), payload));
  return id;
}

inline void write_pack(const std::filesystem::path &objects_dir, std::string_view name,
                       const PackBuilder &b) {
  const auto dir = objects_dir / "pack";
  write_file(dir / ("pack-" + std::string(name) + ".pack"), b.pack());
  write_file(dir / ("pack-" + std::string(name) + ".idx"), b.index());
}

// True if `fn` throws gitpeek::Error carrying `code`.
inline bool throws_code(const std::function<void()> &fn, gitpeek::Errc code) {
  try {
    fn();
  } catch (const gitpeek::Error &e) {
    return e.code() == code;
  }
  return false;
}

} // namespace fixtures
