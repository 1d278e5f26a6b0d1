#include "workflow_machine.hpp"
#include "util/string_utils.hpp"
#include <nlohmann/json.hpp>

namespace f0rge::workflow {

namespace {

constexpr workflow_state dispatchable_states[] = {
    workflow_state::proposal, workflow_state::material_selection, workflow_state::circuit_design,
    workflow_state::critique, workflow_state::plan_emission
};

std::string dispatchable_list() {
  std::string out;
  for (workflow_state value : dispatchable_states) {
    if (!out.empty()) {
      out += ", ";
    }
    out += workflow_state_name(value);
  }
  return out;
}

// exact answer first, otherwise the state named earliest in the text
std::optional<workflow_state> parse_dispatch_answer(std::string_view answer) {
  if (auto exact = parse_workflow_state(answer); exact && *exact != workflow_state::done) {
    return exact;
  }

  std::string lower = util::to_lower(answer);
  std::optional<workflow_state> best;
  size_t best_pos = std::string::npos;
  for (workflow_state value : dispatchable_states) {
    size_t pos = lower.find(workflow_state_name(value));
    if (pos != std::string::npos && (best_pos == std::string::npos || pos < best_pos)) {
      best = value;
      best_pos = pos;
    }
  }
  return best;
}

} // namespace

std::string_view workflow_state_name(workflow_state value) noexcept {
  switch (value) {
  case workflow_state::proposal:
    return "proposal";
  case workflow_state::material_selection:
    return "material_selection";
  case workflow_state::circuit_design:
    return "circuit_design";
  case workflow_state::critique:
    return "critique";
  case workflow_state::plan_emission:
    return "plan_emission";
  case workflow_state::done:
    return "done";
  }
  return "unknown";
}

std::optional<workflow_state> parse_workflow_state(std::string_view name) {
  std::string lower = util::to_lower(util::trim_view(name));
  for (workflow_state value : dispatchable_states) {
    if (workflow_state_name(value) == lower) {
      return value;
    }
  }
  if (lower == "done") {
    return workflow_state::done;
  }
  return std::nullopt;
}

const std::vector<transition>& transition_table() {
  static const std::vector<transition> table = {
      {workflow_state::proposal, workflow_event::completed, workflow_state::material_selection},
      {workflow_state::material_selection, workflow_event::completed, workflow_state::circuit_design},
      {workflow_state::circuit_design, workflow_event::completed, workflow_state::critique},
      {workflow_state::critique, workflow_event::approved, workflow_state::plan_emission},
      {workflow_state::critique, workflow_event::rejected, workflow_state::proposal},
      {workflow_state::plan_emission, workflow_event::completed, workflow_state::done},
  };
  return table;
}

std::optional<workflow_state> next_state(workflow_state from, workflow_event on) {
  for (const auto& edge : transition_table()) {
    if (edge.from == from && edge.on == on) {
      return edge.to;
    }
  }
  return std::nullopt;
}

std::optional<role> role_for(workflow_state value) noexcept {
  switch (value) {
  case workflow_state::proposal:
    return role::proposal;
  case workflow_state::material_selection:
    return role::material_selection;
  case workflow_state::circuit_design:
    return role::circuit_design;
  case workflow_state::critique:
    return role::critique;
  default:
    return std::nullopt;
  }
}

bool needs_clarification(std::string_view output, const std::vector<std::string>& markers) {
  std::string lower = util::to_lower(output);
  for (const auto& marker : markers) {
    if (marker.empty()) {
      continue;
    }
    if (lower.find(util::to_lower(marker)) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string render_design_packet(const design_context& context) {
  nlohmann::ordered_json packet = nlohmann::ordered_json::object();
  auto put = [&packet](const char* key, const std::string& value) {
    if (!value.empty()) {
      packet[key] = value;
    }
  };

  put("goal", context.goal);
  put("corrective_context", context.feedback);
  put("previous_proposal", context.previous_proposal);
  put("proposal", context.proposal);
  put("materials", context.materials);
  put("circuit", context.circuit);
  put("critique", context.critique);
  return packet.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

workflow_machine::workflow_machine(role_gateway& gateway, prompt_book prompts, workflow_config config)
    : gateway_(gateway), prompts_(std::move(prompts)), config_(std::move(config)) {}

param_map workflow_machine::prompt_fields(const design_context& context) const {
  return param_map{
      {"goal", context.goal},
      {"feedback", context.feedback},
      {"approval_marker", config_.approval_marker},
      {"stages", dispatchable_list()},
  };
}

void workflow_machine::store_output(workflow_state current, const std::string& output, design_context& context)
    const {
  switch (current) {
  case workflow_state::proposal:
    context.proposal = output;
    break;
  case workflow_state::material_selection:
    context.materials = output;
    break;
  case workflow_state::circuit_design:
    context.circuit = output;
    break;
  case workflow_state::critique:
    context.critique = output;
    break;
  default:
    break;
  }
}

result<std::optional<workflow_state>> workflow_machine::dispatch(
    workflow_state current, const std::string& output, design_context& context
) {
  std::string prompt = prompts_.render(role::dispatch, prompt_fields(context));
  std::string packet = render_design_packet(context) + "\n\nCLARIFICATION REQUESTED BY " +
                       std::string(workflow_state_name(current)) + ":\n" + output;

  auto answer = gateway_.call(role::dispatch, prompt, packet);
  if (!answer.ok()) {
    return error_result<std::optional<workflow_state>>(answer.status);
  }
  context.transcript.push_back({role::dispatch, prompt, answer.value});

  auto routed = parse_dispatch_answer(answer.value);
  if (!routed) {
    config_.log.wrn(
        "dispatch answer names no stage, keeping fixed edge",
        redlog::field("from", std::string(workflow_state_name(current))),
        redlog::field("answer", util::tail_text(answer.value, 120))
    );
    return ok_result(std::optional<workflow_state>{});
  }

  config_.log.inf(
      "dispatch override", redlog::field("from", std::string(workflow_state_name(current))),
      redlog::field("to", std::string(workflow_state_name(*routed)))
  );
  return ok_result(routed);
}

result<workflow_state> workflow_machine::advance(
    workflow_state current, const std::string& output, design_context& context
) {
  if (needs_clarification(output, config_.clarification_markers)) {
    auto routed = dispatch(current, output, context);
    if (!routed.ok()) {
      return error_result<workflow_state>(routed.status);
    }
    if (routed.value) {
      if (*routed.value == workflow_state::plan_emission) {
        context.approved = current == workflow_state::critique;
      }
      return ok_result(*routed.value);
    }
  }

  if (current != workflow_state::critique) {
    return ok_result(*next_state(current, workflow_event::completed));
  }

  if (output.find(config_.approval_marker) != std::string::npos) {
    context.approved = true;
    return ok_result(*next_state(current, workflow_event::approved));
  }

  context.critique_rounds++;
  if (context.critique_rounds >= config_.max_critique_rounds) {
    std::string warning = "critique rejected the design " + std::to_string(context.critique_rounds) +
                          " times, emitting the plan anyway";
    config_.log.wrn(warning, redlog::field("rounds", context.critique_rounds));
    context.warnings.push_back(std::move(warning));
    return ok_result(workflow_state::plan_emission);
  }

  // the rejected proposal and its critique become explicit input to the next proposal
  context.previous_proposal = context.proposal;
  context.proposal.clear();
  context.materials.clear();
  context.circuit.clear();
  config_.log.dbg("critique rejected design", redlog::field("round", context.critique_rounds));
  return ok_result(*next_state(current, workflow_event::rejected));
}

result<design_context> workflow_machine::run(
    const std::string& goal, const std::string& feedback, const cancellation_token* cancel
) {
  design_context context;
  context.goal = goal;
  context.feedback = feedback;

  config_.log.inf("design workflow started", redlog::field("has_feedback", !feedback.empty()));

  workflow_state state = workflow_state::proposal;
  while (state != workflow_state::plan_emission && state != workflow_state::done) {
    if (cancel && cancel->requested()) {
      return error_result<design_context>(error_code::cancelled, "design workflow cancelled");
    }

    auto who = role_for(state);
    if (!who) {
      return error_result<design_context>(
          error_code::internal_error, "no role for state '" + std::string(workflow_state_name(state)) + "'"
      );
    }

    std::string prompt = prompts_.render(*who, prompt_fields(context));
    auto response = gateway_.call(*who, prompt, render_design_packet(context));
    if (!response.ok()) {
      config_.log.wrn(
          "role call failed", redlog::field("role", std::string(role_name(*who))),
          redlog::field("error", response.status.message)
      );
      return error_result<design_context>(response.status);
    }

    config_.log.dbg(
        "role answered", redlog::field("role", std::string(role_name(*who))),
        redlog::field("bytes", response.value.size())
    );
    context.transcript.push_back({*who, prompt, response.value});
    store_output(state, response.value, context);

    auto next = advance(state, response.value, context);
    if (!next.ok()) {
      return error_result<design_context>(next.status);
    }

    context.transitions++;
    config_.log.trc(
        "transition", redlog::field("from", std::string(workflow_state_name(state))),
        redlog::field("to", std::string(workflow_state_name(next.value)))
    );
    state = next.value;

    if (state != workflow_state::plan_emission && context.transitions >= config_.max_transitions) {
      config_.log.err("design workflow exhausted", redlog::field("transitions", context.transitions));
      return error_result<design_context>(make_status(
          error_code::workflow_exhausted,
          "design workflow did not reach plan emission within " + std::to_string(config_.max_transitions) +
              " transitions"
      ));
    }
  }

  config_.log.inf(
      "design workflow reached plan emission", redlog::field("approved", context.approved),
      redlog::field("transitions", context.transitions), redlog::field("critique_rounds", context.critique_rounds)
  );
  return ok_result(std::move(context));
}

} // namespace f0rge::workflow
