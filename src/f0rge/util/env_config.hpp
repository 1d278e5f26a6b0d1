#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include "string_utils.hpp"

namespace f0rge::util {

// reads PREFIX_NAME environment variables; unset or unparseable values fall back to the default
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  bool has(const std::string& name) const;

  template <typename T> T get(const std::string& name, T default_value) const;

  std::vector<std::string> get_list(const std::string& name, char delimiter = ',') const;

  template <typename enum_type>
  enum_type get_enum(
      const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
      enum_type default_value
  ) const;

  std::string env_name(const std::string& name) const { return prefix_ + name; }

private:
  std::string prefix_;
  mutable redlog::logger log_;

  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const;

template <typename enum_type>
enum_type env_config::get_enum(
    const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
    enum_type default_value
) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  for (const auto& pair : mapping) {
    if (to_lower(pair.first) == to_lower(value)) {
      return pair.second;
    }
  }

  log_.wrn("unknown value, using default", redlog::field("variable", env_name(name)), redlog::field("value", value));
  return default_value;
}

} // namespace f0rge::util
