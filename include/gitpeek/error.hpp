#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitpeek {

// Every way a read can fail. Callers switch on Error::code(); nothing is retried.
enum class Errc {
  not_found,
  malformed_header,
  size_mismatch,
  decompression_failure,
  out_of_bounds,
  malformed_delta_stream,
  delta_base_size_mismatch,
  delta_result_size_mismatch,
  delta_chain_too_deep,
  index_version_unsupported,
  checksum_mismatch,
  ambiguous_prefix,
  io_error,
};

/** Stable lowercase name, e.g. "delta_chain_too_deep". */
std::string_view errc_name(Errc code);

class Error : public std::runtime_error {
public:
  Error(Errc code, const std::string &what) : std::runtime_error(what), code_(code) {}

  [[nodiscard]] Errc code() const noexcept { return code_; }

private:
  Errc code_;
};

} // namespace gitpeek
