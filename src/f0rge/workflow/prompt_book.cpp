#include "prompt_book.hpp"
#include "compiler/template_substitution.hpp"

namespace f0rge::workflow {

prompt_book::prompt_book() {
  templates_[role::proposal] = "Goal: {goal}\n"
                               "Propose an experiment that serves the goal. Output a concise hypothesis.";
  templates_[role::material_selection] = "Based on the hypothesis in the context, select core materials and "
                                         "geometry. Output detailed specifications.";
  templates_[role::circuit_design] = "Using the hypothesis and materials in the context, design the drive circuit. "
                                     "Output pulse width, duty cycle and voltage levels.";
  templates_[role::critique] = "Review the proposed experiment in the context for physical consistency and "
                               "feasibility. If the design is sound answer {approval_marker}, otherwise critique it.";
  templates_[role::plan_emission] =
      "Generate the json simulation plan for the '{backend}' backend.\n"
      "Follow the pattern library structure: backend_id, model_name and the stages structure, materials, physics, "
      "setup, analyze and results, each a list of {{\"type\": ..., \"params\": {{...}}}} items.\n"
      "Rules:\n"
      "1. Output ONLY valid json.\n"
      "2. Do not use mathematical expressions; compute the values.\n"
      "3. Do not put comments inside the json.\n"
      "4. The results stage must export '{metric}' to '{artifact}'.";
  templates_[role::arbitration] = "{options}";
  templates_[role::dispatch] = "A stage asked for clarification. Name the single stage that should act next, one "
                               "of: {stages}. Answer with the stage name only.";
}

prompt_book prompt_book::defaults() { return prompt_book{}; }

void prompt_book::set(role who, std::string text) { templates_[who] = std::move(text); }

const std::string& prompt_book::get(role who) const {
  static const std::string empty;
  auto it = templates_.find(who);
  return it == templates_.end() ? empty : it->second;
}

std::string prompt_book::render(role who, const param_map& fields) const {
  return compiler::substitute(get(who), fields).text;
}

} // namespace f0rge::workflow
