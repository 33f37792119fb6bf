#pragma once
#include "gitpeek/config.hpp"
#include "gitpeek/hash.hpp"
#include "gitpeek/object.hpp"
#include "gitpeek/object_store.hpp"
#include "gitpeek/pack.hpp"
#include "gitpeek/pack_index.hpp"
#include "gitpeek/repo.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace gitpeek {

// A pack and its index, loaded once and never modified.
struct LoadedPack {
  PackFile pack;
  PackIndex index;
};

/**
 * Turns object ids into bytes: loose storage first, then every pack in order.
 * Delta chains are followed with an explicit frame stack capped by
 * Options::max_delta_depth, then applied back up to the requested object.
 *
 * All state is fixed at construction; const methods may be called from any
 * number of threads at once.
 */
class ObjectResolver {
public:
  // Open the loose store and every pack of `repo`, using the repository's config.
  explicit ObjectResolver(const Repository& repo);
  ObjectResolver(const Repository& repo, Options options);

  // Assemble from parts that are already loaded.
  ObjectResolver(ObjectStore loose, std::vector<LoadedPack> packs, Options options);

  [[nodiscard]] DecodedObject resolve(const oid& id) const;

  // Full hex id or an unambiguous abbreviation.
  [[nodiscard]] DecodedObject resolve(std::string_view hex) const;

  // Expand an abbreviated hex id. Throws Error{not_found | ambiguous_prefix}.
  [[nodiscard]] oid resolve_prefix(std::string_view hex) const;

  [[nodiscard]] bool contains(const oid& id) const;

  [[nodiscard]] DecodedObject read_loose(const oid& id) const { return loose_.read(id); }
  [[nodiscard]] PackEntry read_pack_entry(std::size_t pack_no, std::uint64_t offset) const;

  // Resolve whatever entry starts at `offset` of pack `pack_no`.
  [[nodiscard]] DecodedObject resolve_at(std::size_t pack_no, std::uint64_t offset) const;

  // Same, for an entry the index lists as `id`; rehashed when verify_objects is set.
  [[nodiscard]] DecodedObject resolve_at(std::size_t pack_no, std::uint64_t offset,
                                         const oid& id) const;

  // Number of deltas between the entry at `offset` and its whole base (0 for whole objects).
  [[nodiscard]] std::size_t delta_depth(std::size_t pack_no, std::uint64_t offset) const;

  [[nodiscard]] const std::vector<LoadedPack>& packs() const { return packs_; }
  [[nodiscard]] const ObjectStore& loose() const { return loose_; }
  [[nodiscard]] const Options& options() const { return options_; }

private:
  struct Location {
    std::size_t pack_no;
    std::uint64_t offset;
  };

  // Search `preferred` first (the pack holding a ref-delta), then all packs in order.
  [[nodiscard]] std::optional<Location> locate(const oid& id,
                                               std::optional<std::size_t> preferred = {}) const;
  [[nodiscard]] DecodedObject resolve_chain(Location start) const;
  void check_pack(std::size_t pack_no) const;
  void verify(const oid& id, const DecodedObject& obj) const;

  ObjectStore loose_;
  std::vector<LoadedPack> packs_;
  Options options_;
};

} // namespace gitpeek
