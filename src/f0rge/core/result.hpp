#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace f0rge {

// error codes shared by every f0rge component
enum class error_code {
  ok,
  invalid_argument,
  config_error,
  not_found,
  missing_pattern,
  unbound_placeholder,
  parse_error,
  no_valid_candidate,
  infrastructure_error,
  timeout,
  cancelled,
  workflow_exhausted,
  io_error,
  internal_error
};

// status holds an error code, a human-readable message and the offending subject
struct status {
  error_code code = error_code::ok;
  std::string message;
  std::string subject; // type name or placeholder name, when one applies
  std::string section; // plan section the failure occurred in, when one applies

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message), {}, {}}; }

inline status make_status(error_code code, std::string message, std::string subject, std::string section = {}) {
  return status{code, std::move(message), std::move(subject), std::move(section)};
}

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  f0rge::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status failure) { return result<T>{T{}, std::move(failure)}; }

std::string_view error_code_name(error_code code) noexcept;

// timeouts are the only failures a caller is expected to retry on its own
inline bool is_retryable(error_code code) noexcept { return code == error_code::timeout; }

} // namespace f0rge
