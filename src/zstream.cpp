#include "gitpeek/zstream.hpp"

#include "gitpeek/error.hpp"

#include <algorithm>
#include <string>
#include <zlib.h>

namespace gitpeek::zstream {

namespace {

// zlib counts in uInt; feed very large regions in slices.
constexpr std::size_t kMaxChunk = std::size_t{1} << 30;

// Upper bound on deflate's expansion; larger declared sizes are corrupt headers.
constexpr std::size_t kMaxDeflateRatio = 1032;

class Inflater {
public:
  Inflater() {
    if (inflateInit(&strm_) != Z_OK) {
      throw Error(Errc::decompression_failure, "zlib: inflateInit failed");
    }
  }
  ~Inflater() { inflateEnd(&strm_); }
  Inflater(const Inflater &) = delete;
  Inflater &operator=(const Inflater &) = delete;

  z_stream &stream() { return strm_; }

private:
  z_stream strm_{};
};

std::string zlib_message(const z_stream &s, int rc) {
  std::string msg = "zlib: inflate failed (" + std::to_string(rc) + ")";
  if (s.msg != nullptr) {
    msg += ": ";
    msg += s.msg;
  }
  return msg;
}

Inflated run_inflate(std::span<const std::uint8_t> input, std::size_t expected, bool exact) {
  if (exact && expected / kMaxDeflateRatio > input.size()) {
    throw Error(Errc::size_mismatch, "zlib: declared size " + std::to_string(expected) +
                                         " cannot come from " + std::to_string(input.size()) +
                                         " compressed bytes");
  }
  Inflater z;
  z_stream &s = z.stream();

  std::vector<std::uint8_t> out(exact ? expected : std::max<std::size_t>(input.size() * 3, 64));
  std::uint8_t overflow = 0; // catches a stream that keeps going past `expected`
  std::size_t in_pos = 0;
  std::size_t produced = 0;

  for (;;) {
    const std::size_t give_in = std::min(input.size() - in_pos, kMaxChunk);
    s.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(input.data() + in_pos));
    s.avail_in = static_cast<uInt>(give_in);

    bool into_overflow = false;
    if (produced == out.size()) {
      if (exact) {
        into_overflow = true;
      } else {
        out.resize(out.size() * 2);
      }
    }
    std::size_t give_out = 0;
    if (into_overflow) {
      s.next_out = &overflow;
      give_out = 1;
    } else {
      s.next_out = out.data() + produced;
      give_out = std::min(out.size() - produced, kMaxChunk);
    }
    s.avail_out = static_cast<uInt>(give_out);

    const int rc = inflate(&s, Z_NO_FLUSH);
    const std::size_t used_in = give_in - s.avail_in;
    const std::size_t made_out = give_out - s.avail_out;
    in_pos += used_in;

    if (into_overflow && made_out > 0) {
      throw Error(Errc::size_mismatch,
                  "zlib: stream inflates past declared size " + std::to_string(expected));
    }
    produced += made_out;

    if (rc == Z_STREAM_END) {
      break;
    }
    if (rc == Z_OK) {
      continue;
    }
    if (rc == Z_BUF_ERROR && (used_in != 0 || made_out != 0)) {
      continue;
    }
    if (rc == Z_BUF_ERROR) {
      throw Error(Errc::decompression_failure, "zlib: truncated stream after " +
                                                   std::to_string(in_pos) + " input bytes");
    }
    throw Error(Errc::decompression_failure, zlib_message(s, rc));
  }

  if (exact && produced != expected) {
    throw Error(Errc::size_mismatch, "zlib: inflated " + std::to_string(produced) +
                                         " bytes, expected " + std::to_string(expected));
  }
  out.resize(produced);
  return Inflated{.data = std::move(out), .consumed = in_pos};
}

} // namespace

Inflated inflate_all(std::span<const std::uint8_t> input) {
  return run_inflate(input, 0, false);
}

Inflated inflate_exact(std::span<const std::uint8_t> input, std::size_t expected) {
  return run_inflate(input, expected, true);
}

} // namespace gitpeek::zstream
