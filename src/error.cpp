#include "gitpeek/error.hpp"

namespace gitpeek {

std::string_view errc_name(Errc code) {
  switch (code) {
  case Errc::not_found:
    return "not_found";
  case Errc::malformed_header:
    return "malformed_header";
  case Errc::size_mismatch:
    return "size_mismatch";
  case Errc::decompression_failure:
    return "decompression_failure";
  case Errc::out_of_bounds:
    return "out_of_bounds";
  case Errc::malformed_delta_stream:
    return "malformed_delta_stream";
  case Errc::delta_base_size_mismatch:
    return "delta_base_size_mismatch";
  case Errc::delta_result_size_mismatch:
    return "delta_result_size_mismatch";
  case Errc::delta_chain_too_deep:
    return "delta_chain_too_deep";
  case Errc::index_version_unsupported:
    return "index_version_unsupported";
  case Errc::checksum_mismatch:
    return "checksum_mismatch";
  case Errc::ambiguous_prefix:
    return "ambiguous_prefix";
  case Errc::io_error:
    return "io_error";
  }
  return "unknown";
}

} // namespace gitpeek
