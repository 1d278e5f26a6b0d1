#include "score_policy.hpp"

namespace f0rge::evaluation {

score_policy::score_policy(std::string metric, std::vector<score_band> bands, score_band crash_penalty)
    : metric_(std::move(metric)), bands_(std::move(bands)), crash_penalty_(std::move(crash_penalty)) {}

score_policy score_policy::defaults() {
  return score_policy(
      "volts",
      {
          score_band{"high", 1000.0, 10.0},
          score_band{"mid", 100.0, 5.0},
          score_band{"low", 10.0, 1.0},
          score_band{"min", std::nullopt, 0.1},
      },
      score_band{"crash", std::nullopt, -1.0}
  );
}

outcome_score score_policy::score(double value) const {
  for (const auto& band : bands_) {
    if (!band.above || value > *band.above) {
      return outcome_score{band.label, band.reward};
    }
  }
  return crash();
}

outcome_score score_policy::crash() const { return outcome_score{crash_penalty_.label, crash_penalty_.reward}; }

status score_policy::validate() const {
  if (metric_.empty()) {
    return make_status(error_code::config_error, "score policy has no metric");
  }
  if (bands_.empty()) {
    return make_status(error_code::config_error, "score policy has no bands");
  }
  for (size_t i = 0; i < bands_.size(); ++i) {
    const auto& band = bands_[i];
    if (band.label.empty()) {
      return make_status(error_code::config_error, "score band " + std::to_string(i) + " has no label");
    }
    if (!band.above && i + 1 != bands_.size()) {
      return make_status(error_code::config_error, "floor band '" + band.label + "' must be last", band.label);
    }
    if (i > 0 && band.above && bands_[i - 1].above && *band.above >= *bands_[i - 1].above) {
      return make_status(
          error_code::config_error, "score bands must be in descending threshold order at '" + band.label + "'",
          band.label
      );
    }
  }
  if (bands_.back().above) {
    return make_status(error_code::config_error, "score policy needs a floor band without threshold");
  }
  return ok_status();
}

} // namespace f0rge::evaluation
