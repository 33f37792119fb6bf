#include "gitpeek/byte_cursor.hpp"

#include "gitpeek/error.hpp"

#include <string>

namespace gitpeek {

void ByteCursor::require(std::size_t n) const {
  if (n > remaining()) {
    throw Error(Errc::out_of_bounds, "cursor: need " + std::to_string(n) + " bytes at offset " +
                                         std::to_string(pos_) + ", have " +
                                         std::to_string(remaining()));
  }
}

std::uint8_t ByteCursor::read_u8() {
  require(1);
  return data_[pos_++];
}

std::uint32_t ByteCursor::read_u32_be() {
  require(4);
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v = (v << 8U) | data_[pos_++];
  }
  return v;
}

std::uint64_t ByteCursor::read_u64_be() {
  require(8);
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8U) | data_[pos_++];
  }
  return v;
}

std::uint64_t ByteCursor::read_varint() {
  std::uint64_t value = 0;
  unsigned shift = 0;
  std::uint8_t byte = 0;
  do {
    byte = read_u8();
    const std::uint64_t chunk = byte & 0x7FU;
    if (shift >= 64 || (shift > 0 && (chunk >> (64 - shift)) != 0)) {
      throw Error(Errc::malformed_header,
                  "cursor: varint overflows 64 bits at offset " + std::to_string(pos_ - 1));
    }
    value |= chunk << shift;
    shift += 7;
  } while ((byte & 0x80U) != 0);
  return value;
}

std::span<const std::uint8_t> ByteCursor::read_bytes(std::size_t n) {
  require(n);
  auto out = data_.subspan(pos_, n);
  pos_ += n;
  return out;
}

std::span<const std::uint8_t> ByteCursor::read_rest() { return read_bytes(remaining()); }

void ByteCursor::skip(std::size_t n) {
  require(n);
  pos_ += n;
}

} // namespace gitpeek
