#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace f0rge::evaluation {

// a band matches when the metric is strictly greater than `above`; a band without a
// threshold is the floor and matches anything
struct score_band {
  std::string label;
  std::optional<double> above;
  double reward = 0.0;
};

class score_policy {
public:
  score_policy() = default;
  score_policy(std::string metric, std::vector<score_band> bands, score_band crash_penalty);

  // volts: >1000 high, >100 mid, >10 low, otherwise min; crash scores -1
  static score_policy defaults();

  outcome_score score(double value) const;
  outcome_score crash() const;

  // bands must be non-empty, in descending threshold order, and end with a floor
  status validate() const;

  const std::string& metric() const noexcept { return metric_; }
  const std::vector<score_band>& bands() const noexcept { return bands_; }
  const score_band& crash_penalty() const noexcept { return crash_penalty_; }

private:
  std::string metric_;
  std::vector<score_band> bands_;
  score_band crash_penalty_{"crash", std::nullopt, -1.0};
};

} // namespace f0rge::evaluation
