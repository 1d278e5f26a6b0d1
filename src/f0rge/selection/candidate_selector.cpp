#include "candidate_selector.hpp"
#include "block_extractor.hpp"
#include "core/plan_codec.hpp"
#include <redlog.hpp>
#include <sstream>

namespace f0rge::selection {

candidate_selector::candidate_selector(size_t k) : k_(k) {}

candidate candidate_selector::make_candidate(size_t index, result<std::string> generated) const {
  candidate out;
  out.index = index;

  if (!generated.ok()) {
    out.diagnostic = "generator failed: " + generated.status.message;
    return out;
  }
  out.raw_text = std::move(generated.value);

  auto block = extract_structured_block(out.raw_text);
  if (!block) {
    out.diagnostic = "no structured block in generator output";
    return out;
  }

  auto parsed = parse_plan(*block);
  if (!parsed.ok()) {
    out.diagnostic = parsed.status.message;
    return out;
  }

  out.parsed = std::move(parsed.value);
  out.valid = true;
  return out;
}

result<selection_outcome> candidate_selector::select(
    const generate_fn& generate, const arbitrate_fn& arbitrate, const std::string& prompt
) const {
  auto log = redlog::get_logger("f0rge.selector");
  log.dbg("sampling candidates", redlog::field("k", k_));

  selection_outcome out;
  std::vector<candidate> valid;

  for (size_t i = 0; i < k_; ++i) {
    auto generated = generate(prompt);
    out.generate_calls++;

    candidate drafted = make_candidate(i, std::move(generated));
    if (drafted.valid) {
      log.dbg("candidate valid", redlog::field("draft", i + 1));
      candidate copy = drafted;
      copy.index = valid.size();
      valid.push_back(std::move(copy));
    } else {
      log.wrn("candidate discarded", redlog::field("draft", i + 1), redlog::field("reason", drafted.diagnostic));
    }
    out.candidates.push_back(std::move(drafted));
  }

  if (valid.empty()) {
    log.err("no valid candidate", redlog::field("attempts", k_));
    return error_result<selection_outcome>(
        error_code::no_valid_candidate, "no valid candidate after " + std::to_string(k_) + " attempts"
    );
  }

  if (valid.size() == 1) {
    out.chosen = valid.front().parsed;
    out.chosen_index = 0;
    return ok_result(std::move(out));
  }

  size_t chosen = 0;
  auto verdict = arbitrate(valid);
  if (verdict.ok()) {
    chosen = parse_arbitration_index(verdict.value, valid.size());
  } else {
    log.wrn("arbitration failed, using first candidate", redlog::field("error", verdict.status.message));
  }

  log.inf("arbitrated candidates", redlog::field("valid", valid.size()), redlog::field("chosen", chosen));
  out.arbitrated = true;
  out.chosen_index = chosen;
  out.chosen = valid[chosen].parsed;
  return ok_result(std::move(out));
}

result<selection_outcome> select_plan(
    const generate_fn& generate, const arbitrate_fn& arbitrate, const std::string& prompt, size_t k
) {
  return candidate_selector(k).select(generate, arbitrate, prompt);
}

size_t parse_arbitration_index(const std::string& response, size_t candidate_count) {
  auto index = extract_first_index(response);
  if (!index || *index >= candidate_count) {
    return 0;
  }
  return *index;
}

std::string format_arbitration_prompt(const std::vector<candidate>& candidates) {
  std::ostringstream oss;
  oss << "Review these " << candidates.size() << " simulation plans.\n";
  oss << "Select the best one based on correct use of the pattern library and consistency with the design.\n";
  oss << "Return ONLY the integer number of the best option (e.g. \"0\" or \"1\").\n";
  for (size_t i = 0; i < candidates.size(); ++i) {
    oss << "\n--- OPTION " << i << " ---\n" << dump_plan(candidates[i].parsed) << "\n";
  }
  return oss.str();
}

} // namespace f0rge::selection
