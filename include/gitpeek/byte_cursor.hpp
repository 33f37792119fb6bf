#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

namespace gitpeek {

/**
 * Forward-only reader over a borrowed byte buffer.
 * Every read checks the remaining length and throws Error{out_of_bounds}
 * instead of returning short data. The cursor never owns the bytes.
 */
class ByteCursor {
public:
  explicit ByteCursor(std::span<const std::uint8_t> data) : data_(data) {}

  [[nodiscard]] std::size_t position() const { return pos_; }
  [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }
  [[nodiscard]] bool at_end() const { return pos_ == data_.size(); }

  std::uint8_t read_u8();
  std::uint32_t read_u32_be();
  std::uint64_t read_u64_be();

  // 7 bits per byte, least significant group first; top bit means "more follows".
  std::uint64_t read_varint();

  // Next n bytes as a view into the underlying buffer; advances past them.
  std::span<const std::uint8_t> read_bytes(std::size_t n);

  // Everything from the current position to the end; advances to the end.
  std::span<const std::uint8_t> read_rest();

  void skip(std::size_t n);

private:
  void require(std::size_t n) const;

  std::span<const std::uint8_t> data_;
  std::size_t pos_ = 0;
};

} // namespace gitpeek
