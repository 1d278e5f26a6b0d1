#pragma once

#include "core/result.hpp"
#include "execution/execution_runner.hpp"
#include "library/library_catalog.hpp"
#include "loop/repair_loop.hpp"
#include "util/env_config.hpp"
#include "workflow/role_gateway.hpp"
#include "workflow/workflow_machine.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace f0rge::config {

inline constexpr const char* env_prefix = "F0RGE_";

// everything a repair cycle needs; missing keys keep these defaults
struct loop_config {
  std::string goal;
  loop::loop_options loop;
  execution::runner_config runner;
  workflow::workflow_config workflow;
  workflow::command_gateway_config roles;
  std::map<workflow::role, std::string> prompts; // replaces the built-in template of a role
  std::filesystem::path library_dir = "library";
  library::library_schema schema = library::library_schema::defaults();
  std::vector<library::backend_descriptor> extra_backends;
  std::string trajectory_log; // jsonl path; empty logs trajectories only
};

result<loop_config> parse_loop_config(std::string_view text);
result<loop_config> loop_config_from_json(const nlohmann::json& document);
result<loop_config> load_loop_config(const std::filesystem::path& path);

// F0RGE_* variables override whatever the file set
void apply_env_overrides(loop_config& config, const util::env_config& env);

status validate_loop_config(const loop_config& config);

// prompt book with the configured overrides applied over the defaults
workflow::prompt_book make_prompt_book(const loop_config& config);

// catalog with the configured library directory, schema and extra backends
library::library_catalog make_catalog(const loop_config& config);

} // namespace f0rge::config
