#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace f0rge::workflow {

enum class role { proposal, material_selection, circuit_design, critique, plan_emission, arbitration, dispatch };

std::string_view role_name(role value) noexcept;
std::optional<role> parse_role(std::string_view name);

// text-generation collaborator. calls are pure: whatever history a role needs is
// passed in `context`, nothing is remembered between calls.
class role_gateway {
public:
  virtual ~role_gateway() = default;

  virtual result<std::string> call(role who, const std::string& prompt, const std::string& context) = 0;
};

struct command_gateway_config {
  std::vector<std::string> default_command;
  std::map<role, std::vector<std::string>> commands; // per-role override of default_command
  std::chrono::milliseconds timeout{0};
};

// runs one external command per call; context then prompt are written to its stdin and
// its stdout is the response. a timeout is reported as error_code::timeout.
class command_role_gateway : public role_gateway {
public:
  explicit command_role_gateway(command_gateway_config config, const cancellation_token* cancel = nullptr);

  result<std::string> call(role who, const std::string& prompt, const std::string& context) override;

  std::vector<std::string> command_for(role who) const;

  static std::string compose_input(role who, const std::string& prompt, const std::string& context);

private:
  command_gateway_config config_;
  const cancellation_token* cancel_;
};

} // namespace f0rge::workflow
