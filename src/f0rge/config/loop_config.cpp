#include "loop_config.hpp"
#include "util/string_utils.hpp"
#include <fstream>
#include <iterator>
#include <sstream>

#include <redlog.hpp>

namespace f0rge::config {

namespace {

using json = nlohmann::json;

std::vector<std::string> string_list(const json& value, const char* key) {
  if (!value.is_array()) {
    throw std::invalid_argument(std::string(key) + " must be a list of strings");
  }
  std::vector<std::string> out;
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      throw std::invalid_argument(std::string(key) + " must be a list of strings");
    }
    out.push_back(entry.get<std::string>());
  }
  return out;
}

// a command is either a list of arguments or one string split on whitespace
std::vector<std::string> command_list(const json& value, const char* key) {
  if (value.is_string()) {
    std::vector<std::string> out;
    std::istringstream words(value.get<std::string>());
    std::string word;
    while (words >> word) {
      out.push_back(word);
    }
    return out;
  }
  return string_list(value, key);
}

evaluation::score_band parse_band(const json& value, bool allow_threshold) {
  if (!value.is_object()) {
    throw std::invalid_argument("score band must be an object");
  }
  evaluation::score_band band;
  band.label = value.at("label").get<std::string>();
  band.reward = value.at("reward").get<double>();
  if (value.contains("above") && !value.at("above").is_null()) {
    if (!allow_threshold) {
      throw std::invalid_argument("crash band '" + band.label + "' cannot have a threshold");
    }
    band.above = value.at("above").get<double>();
  }
  return band;
}

void parse_scoring(const json& value, loop::loop_options& options) {
  std::string metric = value.value("metric", options.scoring.metric());
  std::vector<evaluation::score_band> bands = options.scoring.bands();
  evaluation::score_band crash = options.scoring.crash_penalty();

  if (value.contains("bands")) {
    bands.clear();
    for (const auto& entry : value.at("bands")) {
      bands.push_back(parse_band(entry, true));
    }
  }
  if (value.contains("crash")) {
    crash = parse_band(value.at("crash"), false);
  }
  options.scoring = evaluation::score_policy(std::move(metric), std::move(bands), std::move(crash));
}

void parse_library(const json& value, loop_config& config) {
  if (value.contains("dir")) {
    config.library_dir = value.at("dir").get<std::string>();
  }
  if (value.contains("extra_categories")) {
    for (auto& category : string_list(value.at("extra_categories"), "library.extra_categories")) {
      if (!config.schema.allows(category)) {
        config.schema.pattern_categories.push_back(std::move(category));
      }
    }
  }
  config.schema.reject_collisions = value.value("reject_collisions", config.schema.reject_collisions);

  if (value.contains("backends")) {
    for (const auto& entry : value.at("backends")) {
      library::backend_descriptor backend;
      backend.id = entry.at("id").get<std::string>();
      backend.document = entry.value("document", backend.id + ".json");
      if (entry.contains("interpreter")) {
        backend.interpreter = command_list(entry.at("interpreter"), "library.backends.interpreter");
      }
      config.extra_backends.push_back(std::move(backend));
    }
  }
}

void parse_workflow(const json& value, workflow::workflow_config& workflow) {
  workflow.approval_marker = value.value("approval_marker", workflow.approval_marker);
  if (value.contains("clarification_markers")) {
    workflow.clarification_markers = string_list(value.at("clarification_markers"), "workflow.clarification_markers");
  }
  workflow.max_critique_rounds = value.value("max_critique_rounds", workflow.max_critique_rounds);
  workflow.max_transitions = value.value("max_transitions", workflow.max_transitions);
}

void parse_roles(const json& value, workflow::command_gateway_config& roles) {
  if (!value.is_object()) {
    throw std::invalid_argument("roles must be an object");
  }
  for (const auto& [key, command] : value.items()) {
    if (key == "default") {
      roles.default_command = command_list(command, "roles.default");
      continue;
    }
    auto who = workflow::parse_role(key);
    if (!who) {
      throw std::invalid_argument("unknown role '" + key + "'");
    }
    roles.commands[*who] = command_list(command, "roles");
  }
}

void parse_prompts(const json& value, std::map<workflow::role, std::string>& prompts) {
  for (const auto& [key, text] : value.items()) {
    auto who = workflow::parse_role(key);
    if (!who) {
      throw std::invalid_argument("unknown role '" + key + "' in prompts");
    }
    if (text.is_array()) {
      std::string joined;
      for (const auto& line : string_list(text, "prompts")) {
        joined += line;
        joined += '\n';
      }
      prompts[*who] = std::move(joined);
    } else {
      prompts[*who] = text.get<std::string>();
    }
  }
}

void parse_into(const json& document, loop_config& config) {
  config.goal = document.value("goal", config.goal);
  config.trajectory_log = document.value("trajectory_log", config.trajectory_log);

  auto& options = config.loop;
  if (document.contains("work_dir")) {
    options.work_dir = document.at("work_dir").get<std::string>();
  }
  options.script_name = document.value("script_name", options.script_name);
  options.artifact_name = document.value("artifact_name", options.artifact_name);
  options.backend_hint = document.value("backend", options.backend_hint);
  options.max_attempts = document.value("max_attempts", options.max_attempts);
  options.candidates_k = document.value("candidates_k", options.candidates_k);
  options.isolate = document.value("isolate", options.isolate);

  if (document.contains("compile_mode")) {
    std::string mode = util::to_lower(document.at("compile_mode").get<std::string>());
    if (mode == "strict") {
      options.mode = compile_mode::strict;
    } else if (mode == "tolerant") {
      options.mode = compile_mode::tolerant;
    } else {
      throw std::invalid_argument("compile_mode must be strict or tolerant, got '" + mode + "'");
    }
  }

  if (document.contains("interpreter")) {
    config.runner.interpreter = command_list(document.at("interpreter"), "interpreter");
  }
  if (document.contains("isolation")) {
    const auto& isolation = document.at("isolation");
    if (isolation.contains("runtime")) {
      config.runner.isolation.runtime = command_list(isolation.at("runtime"), "isolation.runtime");
    }
    config.runner.isolation.image = isolation.value("image", config.runner.isolation.image);
  }
  if (document.contains("timeouts")) {
    const auto& timeouts = document.at("timeouts");
    config.runner.timeout = std::chrono::milliseconds(timeouts.value("execution_ms", config.runner.timeout.count()));
    config.roles.timeout = std::chrono::milliseconds(timeouts.value("role_ms", config.roles.timeout.count()));
  }

  if (document.contains("scoring")) {
    parse_scoring(document.at("scoring"), options);
  }
  if (document.contains("library")) {
    parse_library(document.at("library"), config);
  }
  if (document.contains("workflow")) {
    parse_workflow(document.at("workflow"), config.workflow);
  }
  if (document.contains("roles")) {
    parse_roles(document.at("roles"), config.roles);
  }
  if (document.contains("prompts")) {
    parse_prompts(document.at("prompts"), config.prompts);
  }
}

} // namespace

result<loop_config> loop_config_from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    return error_result<loop_config>(error_code::config_error, "configuration must be a json object");
  }

  loop_config config;
  try {
    parse_into(document, config);
  } catch (const nlohmann::json::exception& e) {
    return error_result<loop_config>(error_code::config_error, std::string("invalid configuration: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return error_result<loop_config>(error_code::config_error, std::string("invalid configuration: ") + e.what());
  }

  auto valid = validate_loop_config(config);
  if (!valid.ok()) {
    return error_result<loop_config>(valid);
  }
  return ok_result(std::move(config));
}

result<loop_config> parse_loop_config(std::string_view text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    return error_result<loop_config>(error_code::config_error, std::string("configuration is not json: ") + e.what());
  }
  return loop_config_from_json(document);
}

result<loop_config> load_loop_config(const std::filesystem::path& path) {
  auto log = redlog::get_logger("f0rge.config");

  std::ifstream file(path);
  if (!file.is_open()) {
    log.err("cannot open configuration", redlog::field("path", path.string()));
    return error_result<loop_config>(make_status(
        error_code::config_error, "cannot open configuration " + path.string(), path.string()
    ));
  }
  std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  auto parsed = parse_loop_config(text);
  if (!parsed.ok()) {
    log.err("configuration rejected", redlog::field("path", path.string()), redlog::field("error", parsed.status.message));
    return parsed;
  }
  log.dbg("configuration loaded", redlog::field("path", path.string()));
  return parsed;
}

void apply_env_overrides(loop_config& config, const util::env_config& env) {
  auto& options = config.loop;
  options.max_attempts = env.get<size_t>("MAX_ATTEMPTS", options.max_attempts);
  options.candidates_k = env.get<size_t>("CANDIDATES_K", options.candidates_k);
  options.isolate = env.get<bool>("ISOLATE", options.isolate);
  options.backend_hint = env.get<std::string>("BACKEND", options.backend_hint);
  options.work_dir = env.get<std::string>("WORK_DIR", options.work_dir.string());
  options.mode = env.get_enum<compile_mode>(
      {{"strict", compile_mode::strict}, {"tolerant", compile_mode::tolerant}}, "COMPILE_MODE", options.mode
  );

  config.goal = env.get<std::string>("GOAL", config.goal);
  config.library_dir = env.get<std::string>("LIBRARY_DIR", config.library_dir.string());
  config.trajectory_log = env.get<std::string>("TRAJECTORY_LOG", config.trajectory_log);
  config.runner.isolation.image = env.get<std::string>("IMAGE", config.runner.isolation.image);

  if (env.has("EXECUTION_TIMEOUT_MS")) {
    config.runner.timeout =
        std::chrono::milliseconds(env.get<size_t>("EXECUTION_TIMEOUT_MS", static_cast<size_t>(config.runner.timeout.count())));
  }
  if (env.has("ROLE_TIMEOUT_MS")) {
    config.roles.timeout =
        std::chrono::milliseconds(env.get<size_t>("ROLE_TIMEOUT_MS", static_cast<size_t>(config.roles.timeout.count())));
  }

  auto role_command = env.get_list("ROLE_COMMAND", ' ');
  if (!role_command.empty()) {
    config.roles.default_command = std::move(role_command);
  }
}

status validate_loop_config(const loop_config& config) {
  if (config.loop.max_attempts == 0) {
    return make_status(error_code::config_error, "max_attempts must be at least 1", "max_attempts");
  }
  if (config.loop.candidates_k == 0) {
    return make_status(error_code::config_error, "candidates_k must be at least 1", "candidates_k");
  }
  if (config.loop.script_name.empty() || config.loop.artifact_name.empty()) {
    return make_status(error_code::config_error, "script_name and artifact_name must be set");
  }
  if (config.workflow.approval_marker.empty()) {
    return make_status(error_code::config_error, "approval_marker must not be empty", "approval_marker");
  }
  if (config.workflow.max_transitions == 0) {
    return make_status(error_code::config_error, "max_transitions must be at least 1", "max_transitions");
  }
  if (config.runner.interpreter.empty()) {
    return make_status(error_code::config_error, "interpreter must not be empty", "interpreter");
  }
  for (const auto& backend : config.extra_backends) {
    if (backend.id.empty() || backend.document.empty()) {
      return make_status(error_code::config_error, "backend entries need an id and a document");
    }
  }
  return config.loop.scoring.validate();
}

workflow::prompt_book make_prompt_book(const loop_config& config) {
  auto book = workflow::prompt_book::defaults();
  for (const auto& [who, text] : config.prompts) {
    book.set(who, text);
  }
  return book;
}

library::library_catalog make_catalog(const loop_config& config) {
  library::library_catalog catalog(config.library_dir, config.schema);
  for (const auto& backend : config.extra_backends) {
    catalog.register_backend(backend);
  }
  return catalog;
}

} // namespace f0rge::config
