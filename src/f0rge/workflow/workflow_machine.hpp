#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"
#include "prompt_book.hpp"
#include "role_gateway.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <redlog.hpp>

namespace f0rge::workflow {

enum class workflow_state { proposal, material_selection, circuit_design, critique, plan_emission, done };

enum class workflow_event { completed, approved, rejected };

std::string_view workflow_state_name(workflow_state value) noexcept;
std::optional<workflow_state> parse_workflow_state(std::string_view name);

struct transition {
  workflow_state from;
  workflow_event on;
  workflow_state to;
};

// fixed edges of the design workflow
const std::vector<transition>& transition_table();
std::optional<workflow_state> next_state(workflow_state from, workflow_event on);

// role that acts in a state; plan_emission and done have none here
std::optional<role> role_for(workflow_state value) noexcept;

// true when the output carries any of the markers, compared case-insensitively
bool needs_clarification(std::string_view output, const std::vector<std::string>& markers);

struct workflow_config {
  std::string approval_marker = "APPROVE";
  std::vector<std::string> clarification_markers{"[CLARIFY]", "QUESTION:", "NEED MORE INFO"};
  size_t max_critique_rounds = 3;
  size_t max_transitions = 32;
  redlog::logger log = redlog::get_logger("f0rge.workflow");
};

struct role_exchange {
  role who;
  std::string prompt;
  std::string response;
};

// everything the design roles produced; rendered explicitly into every role call
struct design_context {
  std::string goal;
  std::string feedback; // corrective context from earlier repair attempts
  std::string proposal;
  std::string materials;
  std::string circuit;
  std::string critique;
  std::string previous_proposal; // proposal the last critique rejected
  size_t critique_rounds = 0;
  size_t transitions = 0;
  bool approved = false;
  std::vector<role_exchange> transcript;
  std::vector<std::string> warnings;
};

// json packet of the non-empty design fields, in workflow order
std::string render_design_packet(const design_context& context);

class workflow_machine {
public:
  workflow_machine(role_gateway& gateway, prompt_book prompts, workflow_config config = {});

  // runs proposal through critique and stops in plan_emission; a failed role call ends the
  // run with the gateway's status
  result<design_context> run(
      const std::string& goal, const std::string& feedback = {}, const cancellation_token* cancel = nullptr
  );

  const workflow_config& config() const noexcept { return config_; }
  const prompt_book& prompts() const noexcept { return prompts_; }

private:
  role_gateway& gateway_;
  prompt_book prompts_;
  workflow_config config_;

  result<workflow_state> advance(workflow_state current, const std::string& output, design_context& context);
  result<std::optional<workflow_state>> dispatch(
      workflow_state current, const std::string& output, design_context& context
  );
  void store_output(workflow_state current, const std::string& output, design_context& context) const;
  param_map prompt_fields(const design_context& context) const;
};

} // namespace f0rge::workflow
