#include "vectra/error.hpp"

namespace vectra::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::validation_failed: return "validation_failed";
    case error_code::not_found: return "not_found";
    case error_code::transient_write: return "transient_write";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

} // namespace vectra::core
