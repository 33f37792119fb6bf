#include "gitpeek/delta.hpp"

#include "gitpeek/byte_cursor.hpp"
#include "gitpeek/consts.hpp"
#include "gitpeek/error.hpp"

#include <algorithm>
#include <string>

namespace gitpeek::delta {

namespace {

Instruction read_instruction(ByteCursor &cur) {
  const std::size_t at = cur.position();
  const std::uint8_t op = cur.read_u8();

  if ((op & 0x80U) != 0) {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    for (unsigned i = 0; i < 4; ++i) {
      if ((op & (1U << i)) != 0) {
        offset |= static_cast<std::uint64_t>(cur.read_u8()) << (8 * i);
      }
    }
    for (unsigned i = 0; i < 3; ++i) {
      if ((op & (0x10U << i)) != 0) {
        length |= static_cast<std::uint64_t>(cur.read_u8()) << (8 * i);
      }
    }
    if (length == 0) {
      length = consts::kDefaultCopyLen;
    }
    return Copy{.offset = offset, .length = length};
  }

  if (op == 0) {
    throw Error(Errc::malformed_delta_stream,
                "delta: reserved opcode 0x00 at offset " + std::to_string(at));
  }
  return Insert{.bytes = cur.read_bytes(op)};
}

void apply_one(std::vector<std::uint8_t> &out, std::span<const std::uint8_t> base,
               const Instruction &ins, std::uint64_t result_size) {
  std::span<const std::uint8_t> piece;
  if (const auto *copy = std::get_if<Copy>(&ins)) {
    if (copy->offset > base.size() || copy->length > base.size() - copy->offset) {
      throw Error(Errc::malformed_delta_stream,
                  "delta: copy of " + std::to_string(copy->length) + " bytes at " +
                      std::to_string(copy->offset) + " overruns base of " +
                      std::to_string(base.size()));
    }
    piece = base.subspan(copy->offset, copy->length);
  } else {
    piece = std::get<Insert>(ins).bytes;
  }
  if (piece.size() > result_size - out.size()) {
    throw Error(Errc::delta_result_size_mismatch,
                "delta: output grows past declared size " + std::to_string(result_size));
  }
  out.insert(out.end(), piece.begin(), piece.end());
}

void check_base(std::span<const std::uint8_t> base, std::uint64_t base_size) {
  if (base_size != base.size()) {
    throw Error(Errc::delta_base_size_mismatch, "delta: expects base of " +
                                                    std::to_string(base_size) + " bytes, got " +
                                                    std::to_string(base.size()));
  }
}

void check_result(const std::vector<std::uint8_t> &out, std::uint64_t result_size) {
  if (out.size() != result_size) {
    throw Error(Errc::delta_result_size_mismatch, "delta: produced " + std::to_string(out.size()) +
                                                      " bytes, declared " +
                                                      std::to_string(result_size));
  }
}

// The declared size is unverified here; never reserve more than the inputs could produce.
void reserve_output(std::vector<std::uint8_t> &out, std::uint64_t result_size,
                    std::size_t input_bytes) {
  const std::uint64_t cap = (static_cast<std::uint64_t>(input_bytes) * 4) + consts::kDefaultCopyLen;
  out.reserve(static_cast<std::size_t>(std::min(result_size, cap)));
}

} // namespace

Delta parse(std::span<const std::uint8_t> stream) {
  ByteCursor cur{stream};
  Delta d;
  d.base_size = cur.read_varint();
  d.result_size = cur.read_varint();
  while (!cur.at_end()) {
    d.instructions.push_back(read_instruction(cur));
  }
  return d;
}

std::vector<std::uint8_t> apply(std::span<const std::uint8_t> base, const Delta &d) {
  check_base(base, d.base_size);
  std::vector<std::uint8_t> out;
  reserve_output(out, d.result_size, base.size());
  for (const auto &ins : d.instructions) {
    apply_one(out, base, ins, d.result_size);
  }
  check_result(out, d.result_size);
  return out;
}

std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> stream) {
  ByteCursor cur{stream};
  const std::uint64_t base_size = cur.read_varint();
  const std::uint64_t result_size = cur.read_varint();
  check_base(base, base_size);

  std::vector<std::uint8_t> out;
  reserve_output(out, result_size, base.size() + stream.size());
  while (!cur.at_end()) {
    apply_one(out, base, read_instruction(cur), result_size);
  }
  check_result(out, result_size);
  return out;
}

} // namespace gitpeek::delta
