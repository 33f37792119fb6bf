#include "gitpeek/resolver.hpp"

#include "gitpeek/consts.hpp"
#include "gitpeek/delta.hpp"
#include "gitpeek/error.hpp"

#include <algorithm>
#include <string>

namespace gitpeek {

namespace {

std::vector<LoadedPack> load_packs(const Repository &repo, HashKind kind) {
  std::vector<LoadedPack> out;
  for (const auto &pair : repo.packs()) {
    LoadedPack lp{.pack = PackFile::open(pair.pack, kind), .index = PackIndex::open(pair.index, kind)};
    out.push_back(std::move(lp));
  }
  return out;
}

std::string where(const PackFile &pack, std::uint64_t offset) {
  return "pack " + pack.path().string() + " @" + std::to_string(offset);
}

} // namespace

ObjectResolver::ObjectResolver(const Repository &repo) : ObjectResolver(repo, repo.options()) {}

ObjectResolver::ObjectResolver(const Repository &repo, Options options)
    : ObjectResolver(ObjectStore{repo.objects_dir(), options.hash_kind},
                     load_packs(repo, options.hash_kind), options) {}

ObjectResolver::ObjectResolver(ObjectStore loose, std::vector<LoadedPack> packs, Options options)
    : loose_(std::move(loose)), packs_(std::move(packs)), options_(options) {
  for (std::size_t i = 0; i < packs_.size(); ++i) {
    check_pack(i);
  }
}

// A pack and its index must describe the same objects.
void ObjectResolver::check_pack(std::size_t pack_no) const {
  const auto &[pack, index] = packs_[pack_no];
  if (pack.hash_kind() != index.hash_kind() || pack.hash_kind() != options_.hash_kind) {
    throw Error(Errc::malformed_header,
                "pack " + pack.path().string() + ": hash kind differs from repository");
  }
  if (index.size() != pack.object_count()) {
    throw Error(Errc::malformed_header, "pack " + pack.path().string() + ": index lists " +
                                            std::to_string(index.size()) + " objects, pack has " +
                                            std::to_string(pack.object_count()));
  }
  if (!std::ranges::equal(index.pack_checksum(), pack.checksum())) {
    throw Error(Errc::checksum_mismatch,
                "pack " + pack.path().string() + ": index belongs to a different pack");
  }
}

std::optional<ObjectResolver::Location> ObjectResolver::locate(
    const oid &id, std::optional<std::size_t> preferred) const {
  if (preferred) {
    if (auto off = packs_[*preferred].index.find(id)) {
      return Location{.pack_no = *preferred, .offset = *off};
    }
  }
  for (std::size_t i = 0; i < packs_.size(); ++i) {
    if (preferred && i == *preferred) {
      continue;
    }
    if (auto off = packs_[i].index.find(id)) {
      return Location{.pack_no = i, .offset = *off};
    }
  }
  return std::nullopt;
}

bool ObjectResolver::contains(const oid &id) const {
  return loose_.contains(id) || locate(id).has_value();
}

DecodedObject ObjectResolver::resolve(const oid &id) const {
  if (loose_.contains(id)) {
    auto obj = loose_.read(id);
    verify(id, obj);
    return obj;
  }
  const auto loc = locate(id);
  if (!loc) {
    throw Error(Errc::not_found, "object " + to_hex(id) + " not found");
  }
  auto obj = resolve_chain(*loc);
  verify(id, obj);
  return obj;
}

DecodedObject ObjectResolver::resolve(std::string_view hex) const {
  return resolve(resolve_prefix(hex));
}

oid ObjectResolver::resolve_prefix(std::string_view hex) const {
  oid full{};
  if (hex.size() == hex_len(options_.hash_kind) && from_hex(hex, full)) {
    return full;
  }
  if (hex.size() < consts::kMinAbbrevLen || !looks_hex_prefix(hex)) {
    throw Error(Errc::not_found, "'" + std::string(hex) + "' is not a valid object name");
  }

  std::vector<oid> matches = loose_.match_prefix(hex);
  for (const auto &lp : packs_) {
    auto more = lp.index.match_prefix(hex);
    matches.insert(matches.end(), more.begin(), more.end());
  }
  std::ranges::sort(matches);
  const auto dup = std::ranges::unique(matches);
  matches.erase(dup.begin(), dup.end());

  if (matches.empty()) {
    throw Error(Errc::not_found, "no object matches '" + std::string(hex) + "'");
  }
  if (matches.size() > 1) {
    throw Error(Errc::ambiguous_prefix, "'" + std::string(hex) + "' matches " +
                                            std::to_string(matches.size()) + " objects");
  }
  return matches.front();
}

PackEntry ObjectResolver::read_pack_entry(std::size_t pack_no, std::uint64_t offset) const {
  if (pack_no >= packs_.size()) {
    throw Error(Errc::out_of_bounds, "no pack #" + std::to_string(pack_no));
  }
  return packs_[pack_no].pack.read_entry(offset);
}

DecodedObject ObjectResolver::resolve_at(std::size_t pack_no, std::uint64_t offset) const {
  if (pack_no >= packs_.size()) {
    throw Error(Errc::out_of_bounds, "no pack #" + std::to_string(pack_no));
  }
  return resolve_chain(Location{.pack_no = pack_no, .offset = offset});
}

DecodedObject ObjectResolver::resolve_at(std::size_t pack_no, std::uint64_t offset,
                                         const oid &id) const {
  auto obj = resolve_at(pack_no, offset);
  verify(id, obj);
  return obj;
}

DecodedObject ObjectResolver::resolve_chain(Location start) const {
  struct Frame {
    std::size_t pack_no;
    PackEntry entry;
  };
  std::vector<Frame> frames;
  std::optional<DecodedObject> base;

  // Walk down to a whole object, remembering every delta on the way.
  Location cur = start;
  while (!base) {
    const PackFile &pack = packs_[cur.pack_no].pack;
    PackEntry entry = pack.read_entry(cur.offset);

    switch (entry.type) {
    case ObjectType::commit:
    case ObjectType::tree:
    case ObjectType::blob:
    case ObjectType::tag: {
      auto data = pack.inflate(entry).data;
      base = DecodedObject{.type = entry.type, .size = data.size(), .data = std::move(data)};
      break;
    }
    case ObjectType::ofs_delta:
    case ObjectType::ref_delta: {
      if (frames.size() + 1 >= options_.max_delta_depth) {
        throw Error(Errc::delta_chain_too_deep,
                    where(packs_[start.pack_no].pack, start.offset) +
                        ": delta chain reaches limit of " +
                        std::to_string(options_.max_delta_depth));
      }
      const std::size_t pack_no = cur.pack_no;
      frames.push_back(Frame{.pack_no = pack_no, .entry = entry});

      if (entry.type == ObjectType::ofs_delta) {
        cur = Location{.pack_no = pack_no, .offset = std::get<OfsBase>(entry.base).offset};
        break;
      }
      const oid &base_id = std::get<oid>(entry.base);
      if (auto loc = locate(base_id, pack_no)) {
        cur = *loc;
      } else if (loose_.contains(base_id)) {
        base = loose_.read(base_id);
      } else {
        throw Error(Errc::not_found, where(pack, entry.offset) + ": ref-delta base " +
                                         to_hex(base_id) + " not found");
      }
      break;
    }
    }
  }

  // Apply the deltas from the base back up to the requested entry.
  DecodedObject obj = std::move(*base);
  while (!frames.empty()) {
    const Frame &f = frames.back();
    const PackFile &pack = packs_[f.pack_no].pack;
    const auto stream = pack.inflate(f.entry).data;
    try {
      obj.data = delta::apply_delta(obj.data, stream);
    } catch (const Error &e) {
      throw Error(e.code(), where(pack, f.entry.offset) + ": " + e.what());
    }
    obj.size = obj.data.size();
    frames.pop_back();
  }
  return obj;
}

std::size_t ObjectResolver::delta_depth(std::size_t pack_no, std::uint64_t offset) const {
  std::size_t depth = 0;
  Location cur{.pack_no = pack_no, .offset = offset};
  for (;;) {
    const PackEntry entry = read_pack_entry(cur.pack_no, cur.offset);
    if (is_terminal(entry.type)) {
      return depth;
    }
    if (++depth >= options_.max_delta_depth) {
      throw Error(Errc::delta_chain_too_deep,
                  where(packs_[pack_no].pack, offset) + ": delta chain reaches limit of " +
                      std::to_string(options_.max_delta_depth));
    }
    if (const auto *ofs = std::get_if<OfsBase>(&entry.base)) {
      cur.offset = ofs->offset;
      continue;
    }
    const oid &base_id = std::get<oid>(entry.base);
    if (auto loc = locate(base_id, cur.pack_no)) {
      cur = *loc;
    } else {
      return depth; // base is loose (or missing; resolve() reports that)
    }
  }
}

void ObjectResolver::verify(const oid &id, const DecodedObject &obj) const {
  if (!options_.verify_objects) {
    return;
  }
  const oid actual = object_id(id.kind(), type_name(obj.type), obj.data);
  if (actual != id) {
    throw Error(Errc::checksum_mismatch,
                "object " + to_hex(id) + " hashes to " + to_hex(actual));
  }
}

} // namespace gitpeek
