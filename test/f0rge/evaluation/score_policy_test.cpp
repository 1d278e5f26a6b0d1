#include <doctest/doctest.h>

#include "f0rge/evaluation/score_policy.hpp"

namespace {

using f0rge::error_code;
using f0rge::evaluation::score_band;
using f0rge::evaluation::score_policy;

} // namespace

TEST_CASE("default policy bands the voltage") {
  auto policy = score_policy::defaults();
  CHECK(policy.metric() == "volts");

  auto high = policy.score(1500.0);
  CHECK(high.label == "high");
  CHECK(high.reward == doctest::Approx(10.0));
  CHECK(policy.score(1000.0).label == "mid");
  CHECK(policy.score(150.0).reward == doctest::Approx(5.0));
  CHECK(policy.score(11.0).label == "low");
  CHECK(policy.score(10.0).label == "min");
  CHECK(policy.score(-3.0).reward == doctest::Approx(0.1));

  auto crash = policy.crash();
  CHECK(crash.label == "crash");
  CHECK(crash.reward == doctest::Approx(-1.0));
  CHECK(policy.validate().ok());
}

TEST_CASE("custom bands are matched in order") {
  score_policy policy(
      "gain", {score_band{"good", 3.0, 1.0}, score_band{"poor", std::nullopt, 0.0}},
      score_band{"failed", std::nullopt, -5.0}
  );
  CHECK(policy.validate().ok());
  CHECK(policy.score(3.5).label == "good");
  CHECK(policy.score(3.0).label == "poor");
  CHECK(policy.crash().reward == doctest::Approx(-5.0));
}

TEST_CASE("policy validation rejects unusable bands") {
  SUBCASE("no bands") {
    CHECK(score_policy("v", {}, score_band{"crash", std::nullopt, -1.0}).validate().code == error_code::config_error);
  }
  SUBCASE("no floor") {
    score_policy policy("v", {score_band{"hi", 1.0, 1.0}}, score_band{"crash", std::nullopt, -1.0});
    CHECK(policy.validate().code == error_code::config_error);
  }
  SUBCASE("floor not last") {
    score_policy policy(
        "v", {score_band{"floor", std::nullopt, 0.0}, score_band{"hi", 1.0, 1.0}},
        score_band{"crash", std::nullopt, -1.0}
    );
    CHECK(policy.validate().code == error_code::config_error);
  }
  SUBCASE("ascending thresholds") {
    score_policy policy(
        "v", {score_band{"a", 1.0, 1.0}, score_band{"b", 5.0, 2.0}, score_band{"c", std::nullopt, 0.0}},
        score_band{"crash", std::nullopt, -1.0}
    );
    CHECK(policy.validate().code == error_code::config_error);
  }
}
