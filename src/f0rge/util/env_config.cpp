#include "env_config.hpp"
#include "string_utils.hpp"
#include <cstdlib>
#include <sstream>

namespace f0rge::util {

namespace {

template <typename T, typename parse_fn>
T parse_or(redlog::logger& log, const std::string& variable, const std::string& value, T default_value,
           const char* type_name, parse_fn parse) {
  try {
    size_t consumed = 0;
    T parsed = parse(value, consumed);
    if (consumed != value.size()) {
      log.wrn("trailing characters in variable, using default", redlog::field("variable", variable),
              redlog::field("type", type_name));
      return default_value;
    }
    return parsed;
  } catch (const std::exception& e) {
    log.wrn("cannot parse variable, using default", redlog::field("variable", variable),
            redlog::field("type", type_name), redlog::field("error", e.what()));
    return default_value;
  }
}

} // namespace

env_config::env_config(const std::string& prefix) : prefix_(prefix), log_(redlog::get_logger("f0rge.config")) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(env_name(name).c_str());
  return value ? trim_copy(value) : std::string();
}

bool env_config::has(const std::string& name) const { return !get_env_value(name).empty(); }

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = to_lower(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  log_.wrn("cannot parse variable as bool, using default", redlog::field("variable", env_name(name)));
  return default_value;
}

template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }
  if (value.front() == '-') {
    log_.wrn("negative value for unsigned variable, using default", redlog::field("variable", env_name(name)));
    return default_value;
  }
  return parse_or<size_t>(log_, env_name(name), value, default_value, "size_t", [](const std::string& text, size_t& pos) {
    return static_cast<size_t>(std::stoull(text, &pos));
  });
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  std::vector<std::string> out;
  std::string value = get_env_value(name);
  if (value.empty()) {
    return out;
  }

  std::stringstream ss(value);
  std::string entry;
  while (std::getline(ss, entry, delimiter)) {
    std::string trimmed = trim_copy(entry);
    if (!trimmed.empty()) {
      out.push_back(std::move(trimmed));
    }
  }
  return out;
}

} // namespace f0rge::util
