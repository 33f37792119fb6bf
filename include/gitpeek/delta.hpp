#pragma once
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace gitpeek::delta {

// Copy `length` bytes starting at `offset` of the base object.
struct Copy {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
};

// Literal bytes carried in the delta itself (1..127 per opcode).
struct Insert {
  std::span<const std::uint8_t> bytes; // view into the delta stream
};

using Instruction = std::variant<Copy, Insert>;

struct Delta {
  std::uint64_t base_size = 0;
  std::uint64_t result_size = 0;
  std::vector<Instruction> instructions;
};

/**
 * Parse an inflated delta stream:
 *   varint base size, varint result size, then opcodes.
 *   1xxxxxxx  copy; bits 0-3 select offset bytes, bits 4-6 select size bytes
 *             (little-endian, absent bytes are zero, size 0 means 0x10000)
 *   0nnnnnnn  insert the next n bytes; n == 0 is reserved
 * The returned Insert views borrow from `stream`.
 * Throws Error{malformed_delta_stream | out_of_bounds}.
 */
Delta parse(std::span<const std::uint8_t> stream);

// Apply a parsed delta to its fully resolved base.
// Throws Error{delta_base_size_mismatch | delta_result_size_mismatch | malformed_delta_stream}.
std::vector<std::uint8_t> apply(std::span<const std::uint8_t> base, const Delta& d);

// parse() + apply() in one pass, without materialising the instruction list.
std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> stream);

} // namespace gitpeek::delta
