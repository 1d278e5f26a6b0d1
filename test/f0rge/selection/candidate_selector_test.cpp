#include <doctest/doctest.h>

#include "f0rge/selection/candidate_selector.hpp"
#include "test_helpers.hpp"

#include <deque>
#include <functional>

namespace {

using f0rge::candidate;
using f0rge::error_code;
using f0rge::ok_result;
using f0rge::result;
using f0rge::selection::candidate_selector;
using f0rge::selection::format_arbitration_prompt;
using f0rge::selection::parse_arbitration_index;
using f0rge::test_helpers::fenced;

// hands out scripted outputs in order and counts calls
struct generator_sequence {
  std::deque<std::string> outputs;
  size_t calls = 0;

  result<std::string> operator()(const std::string&) {
    calls += 1;
    if (outputs.empty()) {
      return ok_result(std::string("nothing"));
    }
    std::string next = outputs.front();
    outputs.pop_front();
    return ok_result(next);
  }
};

std::string plan_named(const std::string& model) {
  return R"({"backend_id": "comsol", "model_name": ")" + model + R"("})";
}

} // namespace

TEST_CASE("selector drops invalid candidates and arbitrates among valid ones") {
  generator_sequence generator{{"I cannot help with that", fenced(plan_named("A")), fenced(plan_named("B"))}};
  size_t arbitrations = 0;
  size_t seen = 0;
  auto arbitrate = [&](const std::vector<candidate>& candidates) {
    arbitrations += 1;
    seen = candidates.size();
    return ok_result(std::string("1"));
  };

  auto selected = candidate_selector(3).select(std::ref(generator), arbitrate, "prompt");
  REQUIRE(selected.ok());
  CHECK(generator.calls == 3);
  CHECK(arbitrations == 1);
  CHECK(seen == 2);
  CHECK(selected.value.arbitrated);
  CHECK(selected.value.chosen.model_name == "B");
  CHECK(selected.value.candidates.size() == 3);
  CHECK_FALSE(selected.value.candidates[0].valid);
}

TEST_CASE("selector returns a single valid candidate without arbitration") {
  generator_sequence generator{{"{broken", fenced(plan_named("only")), "no json"}};
  bool arbitrated = false;
  auto arbitrate = [&](const std::vector<candidate>&) {
    arbitrated = true;
    return ok_result(std::string("0"));
  };

  auto selected = candidate_selector(3).select(std::ref(generator), arbitrate, "prompt");
  REQUIRE(selected.ok());
  CHECK_FALSE(arbitrated);
  CHECK(selected.value.chosen.model_name == "only");
}

TEST_CASE("selector fails after exactly k invalid candidates") {
  generator_sequence generator{{"a", "b", "c", fenced(plan_named("late"))}};
  auto arbitrate = [](const std::vector<candidate>&) { return ok_result(std::string("0")); };

  auto selected = candidate_selector(3).select(std::ref(generator), arbitrate, "prompt");
  CHECK(selected.status.code == error_code::no_valid_candidate);
  CHECK(generator.calls == 3);
}

TEST_CASE("selector counts generator failures as invalid candidates") {
  size_t calls = 0;
  auto generate = [&](const std::string&) {
    calls += 1;
    if (calls == 1) {
      return f0rge::error_result<std::string>(error_code::timeout, "timed out");
    }
    return ok_result(fenced(plan_named("second")));
  };
  auto arbitrate = [](const std::vector<candidate>&) { return ok_result(std::string("0")); };

  auto selected = candidate_selector(2).select(generate, arbitrate, "prompt");
  REQUIRE(selected.ok());
  CHECK(selected.value.chosen.model_name == "second");
  CHECK(selected.value.candidates[0].diagnostic.find("timed out") != std::string::npos);
}

TEST_CASE("unusable arbitration answers fall back to the first candidate") {
  CHECK(parse_arbitration_index("7", 2) == 0);
  CHECK(parse_arbitration_index("the best is the last", 2) == 0);
  CHECK(parse_arbitration_index("Option 1.", 2) == 1);

  generator_sequence generator{{fenced(plan_named("A")), fenced(plan_named("B"))}};
  auto failing = [](const std::vector<candidate>&) {
    return f0rge::error_result<std::string>(error_code::timeout, "arbiter timed out");
  };
  auto selected = candidate_selector(2).select(std::ref(generator), failing, "prompt");
  REQUIRE(selected.ok());
  CHECK(selected.value.chosen.model_name == "A");
}

TEST_CASE("arbitration prompt enumerates candidates from zero") {
  candidate first;
  first.parsed.backend_id = "comsol";
  first.parsed.model_name = "A";
  candidate second = first;
  second.parsed.model_name = "B";

  auto prompt = format_arbitration_prompt({first, second});
  CHECK(prompt.find("--- OPTION 0 ---") != std::string::npos);
  CHECK(prompt.find("--- OPTION 1 ---") != std::string::npos);
  CHECK(prompt.find("--- OPTION 2 ---") == std::string::npos);
  CHECK(prompt.find("\"model_name\":\"B\"") != std::string::npos);
}
