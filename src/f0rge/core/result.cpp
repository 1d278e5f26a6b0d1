#include "result.hpp"

namespace f0rge {

std::string_view error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::config_error:
    return "config_error";
  case error_code::not_found:
    return "not_found";
  case error_code::missing_pattern:
    return "missing_pattern";
  case error_code::unbound_placeholder:
    return "unbound_placeholder";
  case error_code::parse_error:
    return "parse_error";
  case error_code::no_valid_candidate:
    return "no_valid_candidate";
  case error_code::infrastructure_error:
    return "infrastructure_error";
  case error_code::timeout:
    return "timeout";
  case error_code::cancelled:
    return "cancelled";
  case error_code::workflow_exhausted:
    return "workflow_exhausted";
  case error_code::io_error:
    return "io_error";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

} // namespace f0rge
