#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace f0rge::selection {

// black-box generator: prompt in, raw text out (possibly non-deterministic, may time out)
using generate_fn = std::function<result<std::string>(const std::string& prompt)>;

// picks among valid candidates, indexed from 0; expected to answer with one integer
using arbitrate_fn = std::function<result<std::string>(const std::vector<candidate>& candidates)>;

struct selection_outcome {
  plan chosen;
  size_t chosen_index = 0; // index among the valid candidates
  size_t generate_calls = 0;
  bool arbitrated = false;
  std::vector<candidate> candidates; // every attempt, valid or not
};

// best-of-k sampling: invalid candidates are dropped, never repaired
class candidate_selector {
public:
  explicit candidate_selector(size_t k);

  result<selection_outcome> select(const generate_fn& generate, const arbitrate_fn& arbitrate, const std::string& prompt)
      const;

  size_t k() const noexcept { return k_; }

private:
  size_t k_;

  candidate make_candidate(size_t index, result<std::string> generated) const;
};

result<selection_outcome> select_plan(
    const generate_fn& generate, const arbitrate_fn& arbitrate, const std::string& prompt, size_t k
);

// arbitration answers that are unparseable or out of range fall back to 0
size_t parse_arbitration_index(const std::string& response, size_t candidate_count);

std::string format_arbitration_prompt(const std::vector<candidate>& candidates);

} // namespace f0rge::selection
