#pragma once

#include <f0rge/config/loop_config.hpp>
#include <f0rge/core/result.hpp>
#include <f0rge/core/types.hpp>
#include <string>

namespace f0rgex::commands {

// config file when given, built-in defaults otherwise; F0RGE_* variables apply on top
f0rge::result<f0rge::config::loop_config> resolve_config(const std::string& config_path);

f0rge::result<f0rge::plan> read_plan_file(const std::string& path);

void print_failure(const char* what, const f0rge::status& failure);

} // namespace f0rgex::commands
