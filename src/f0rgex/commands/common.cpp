#include "common.hpp"
#include <f0rge/core/plan_codec.hpp>
#include <f0rge/util/env_config.hpp>
#include <fstream>
#include <iostream>
#include <iterator>

namespace f0rgex::commands {

f0rge::result<f0rge::config::loop_config> resolve_config(const std::string& config_path) {
  f0rge::config::loop_config config;
  if (!config_path.empty()) {
    auto loaded = f0rge::config::load_loop_config(config_path);
    if (!loaded.ok()) {
      return loaded;
    }
    config = std::move(loaded.value);
  }

  f0rge::config::apply_env_overrides(config, f0rge::util::env_config(f0rge::config::env_prefix));
  auto valid = f0rge::config::validate_loop_config(config);
  if (!valid.ok()) {
    return f0rge::error_result<f0rge::config::loop_config>(valid);
  }
  return f0rge::ok_result(std::move(config));
}

f0rge::result<f0rge::plan> read_plan_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return f0rge::error_result<f0rge::plan>(f0rge::error_code::io_error, "cannot open plan file " + path);
  }
  std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return f0rge::parse_plan(text);
}

void print_failure(const char* what, const f0rge::status& failure) {
  std::cerr << "error: " << what << ": " << failure.message << " [" << f0rge::error_code_name(failure.code) << "]";
  if (!failure.subject.empty()) {
    std::cerr << " (" << failure.subject;
    if (!failure.section.empty()) {
      std::cerr << " in " << failure.section;
    }
    std::cerr << ")";
  }
  std::cerr << std::endl;
}

} // namespace f0rgex::commands
