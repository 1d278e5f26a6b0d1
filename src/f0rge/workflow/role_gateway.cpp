#include "role_gateway.hpp"
#include "execution/process.hpp"
#include "util/string_utils.hpp"
#include <redlog.hpp>

namespace f0rge::workflow {

namespace {

constexpr role all_roles[] = {role::proposal,      role::material_selection, role::circuit_design, role::critique,
                              role::plan_emission, role::arbitration,        role::dispatch};

} // namespace

std::string_view role_name(role value) noexcept {
  switch (value) {
  case role::proposal:
    return "proposal";
  case role::material_selection:
    return "material_selection";
  case role::circuit_design:
    return "circuit_design";
  case role::critique:
    return "critique";
  case role::plan_emission:
    return "plan_emission";
  case role::arbitration:
    return "arbitration";
  case role::dispatch:
    return "dispatch";
  }
  return "unknown";
}

std::optional<role> parse_role(std::string_view name) {
  std::string lower = util::to_lower(util::trim_view(name));
  for (role value : all_roles) {
    if (role_name(value) == lower) {
      return value;
    }
  }
  return std::nullopt;
}

command_role_gateway::command_role_gateway(command_gateway_config config, const cancellation_token* cancel)
    : config_(std::move(config)), cancel_(cancel) {}

std::vector<std::string> command_role_gateway::command_for(role who) const {
  auto it = config_.commands.find(who);
  if (it != config_.commands.end() && !it->second.empty()) {
    return it->second;
  }
  return config_.default_command;
}

std::string command_role_gateway::compose_input(role who, const std::string& prompt, const std::string& context) {
  std::string input = "ROLE: " + std::string(role_name(who)) + "\n";
  if (!context.empty()) {
    input += "\nCONTEXT:\n" + context + "\n";
  }
  input += "\nTASK:\n" + prompt + "\n";
  return input;
}

result<std::string> command_role_gateway::call(role who, const std::string& prompt, const std::string& context) {
  auto log = redlog::get_logger("f0rge.gateway");

  auto command = command_for(who);
  if (command.empty()) {
    log.err("no command configured for role", redlog::field("role", std::string(role_name(who))));
    return error_result<std::string>(make_status(
        error_code::config_error, "no command configured for role '" + std::string(role_name(who)) + "'",
        std::string(role_name(who))
    ));
  }

  execution::process_spec spec;
  spec.argv = std::move(command);
  spec.stdin_text = compose_input(who, prompt, context);
  spec.timeout = config_.timeout;
  spec.cancel = cancel_;

  log.dbg(
      "calling role", redlog::field("role", std::string(role_name(who))),
      redlog::field("prompt_bytes", prompt.size()), redlog::field("context_bytes", context.size())
  );

  auto ran = execution::run_process(spec);
  if (!ran.ok()) {
    return error_result<std::string>(ran.status);
  }

  const auto& outcome = ran.value;
  if (outcome.how == termination::timed_out) {
    log.wrn("role call timed out", redlog::field("role", std::string(role_name(who))));
    return error_result<std::string>(make_status(
        error_code::timeout, "role '" + std::string(role_name(who)) + "' timed out", std::string(role_name(who))
    ));
  }
  if (outcome.how == termination::cancelled) {
    return error_result<std::string>(error_code::cancelled, "role call cancelled");
  }
  if (!outcome.succeeded()) {
    log.wrn(
        "role command failed", redlog::field("role", std::string(role_name(who))),
        redlog::field("exit_code", outcome.exit_code)
    );
    return error_result<std::string>(make_status(
        error_code::io_error,
        "role '" + std::string(role_name(who)) + "' command exited with " + std::to_string(outcome.exit_code) + ": " +
            util::tail_text(outcome.stderr_text, 512),
        std::string(role_name(who))
    ));
  }

  return ok_result(outcome.stdout_text);
}

} // namespace f0rge::workflow
