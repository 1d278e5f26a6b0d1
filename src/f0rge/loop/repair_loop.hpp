#pragma once

#include "core/cancellation.hpp"
#include "core/types.hpp"
#include "evaluation/score_policy.hpp"
#include "execution/execution_runner.hpp"
#include "library/library_catalog.hpp"
#include "trajectory_sink.hpp"
#include "workflow/role_gateway.hpp"
#include "workflow/workflow_machine.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace f0rge::loop {

struct loop_options {
  size_t max_attempts = 5;
  size_t candidates_k = 3;
  bool isolate = false;
  std::filesystem::path work_dir = "experiments";
  std::string script_name = "current_run.py";
  std::string artifact_name = "current_run.csv";
  std::string backend_hint = "comsol"; // backend the plan-emission role is asked to target
  compile_mode mode = compile_mode::strict;
  evaluation::score_policy scoring = evaluation::score_policy::defaults();
};

enum class stop_reason {
  scored,
  attempts_exhausted,
  no_valid_candidate,
  workflow_failed,
  configuration_failed,
  infrastructure_failed,
  io_failed,
  cancelled
};

std::string_view stop_reason_name(stop_reason value) noexcept;

struct cycle_report {
  bool success = false;
  stop_reason reason = stop_reason::attempts_exhausted;
  std::string detail;
  std::optional<outcome_score> final_score;
  std::vector<repair_attempt> attempts;
};

// generate -> compile -> execute -> evaluate with bounded retries. a cycle never fails:
// every ending, including infrastructure failures, is described by the returned report.
class repair_loop {
public:
  repair_loop(
      workflow::workflow_machine& workflow, workflow::role_gateway& gateway, library::library_catalog& catalog,
      execution::execution_runner& runner, trajectory_sink& sink, loop_options options
  );

  cycle_report run_cycle(const std::string& goal, const cancellation_token* cancel = nullptr);

  std::filesystem::path script_path() const;
  std::filesystem::path artifact_path() const;

  const loop_options& options() const noexcept { return options_; }

private:
  enum class step { retry, stop };

  workflow::workflow_machine& workflow_;
  workflow::role_gateway& gateway_;
  library::library_catalog& catalog_;
  execution::execution_runner& runner_;
  trajectory_sink& sink_;
  loop_options options_;
  mutable redlog::logger log_;

  step attempt_once(
      const std::string& goal, const std::string& feedback, const cancellation_token* cancel, repair_attempt& attempt,
      cycle_report& report
  );
  step evaluate(repair_attempt& attempt, cycle_report& report);
  status write_script(const compiled_script& script) const;
  void record(const repair_attempt& attempt);
};

// corrective context handed to the next attempt
std::string format_feedback(const repair_attempt& attempt);

// diagnostic for a failed compile, naming the offending type or placeholder
std::string describe_compile_failure(const status& failure);

} // namespace f0rge::loop
