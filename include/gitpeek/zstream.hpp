#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace gitpeek::zstream {

struct Inflated {
  std::vector<std::uint8_t> data;
  std::size_t consumed = 0; // compressed bytes read, including the zlib trailer
};

// Inflate one complete zlib stream whose decompressed length is not known up front.
// Bytes after the end of the stream are ignored (reported via `consumed`).
Inflated inflate_all(std::span<const std::uint8_t> input);

// Inflate one complete zlib stream that must decompress to exactly `expected` bytes.
// Throws Error{size_mismatch} if the stream ends early or would produce more.
Inflated inflate_exact(std::span<const std::uint8_t> input, std::size_t expected);

} // namespace gitpeek::zstream
