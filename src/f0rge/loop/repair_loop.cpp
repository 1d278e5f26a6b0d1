#include "repair_loop.hpp"
#include "compiler/plan_compiler.hpp"
#include "core/plan_codec.hpp"
#include "evaluation/result_artifact.hpp"
#include "selection/candidate_selector.hpp"
#include "util/string_utils.hpp"
#include <fstream>
#include <system_error>

namespace f0rge::loop {

namespace {

constexpr size_t diagnostic_tail_bytes = 2000;

} // namespace

std::string_view stop_reason_name(stop_reason value) noexcept {
  switch (value) {
  case stop_reason::scored:
    return "scored";
  case stop_reason::attempts_exhausted:
    return "attempts_exhausted";
  case stop_reason::no_valid_candidate:
    return "no_valid_candidate";
  case stop_reason::workflow_failed:
    return "workflow_failed";
  case stop_reason::configuration_failed:
    return "configuration_failed";
  case stop_reason::infrastructure_failed:
    return "infrastructure_failed";
  case stop_reason::io_failed:
    return "io_failed";
  case stop_reason::cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::string describe_compile_failure(const status& failure) {
  std::string text = "compile failed (" + std::string(error_code_name(failure.code)) + "): " + failure.message;
  if (failure.code == error_code::missing_pattern && !failure.subject.empty()) {
    text += "\nunknown type: '" + failure.subject + "'";
    if (!failure.section.empty()) {
      text += " in section '" + failure.section + "'";
    }
    text += ". use only types defined in the pattern library.";
  } else if (failure.code == error_code::unbound_placeholder && !failure.subject.empty()) {
    text += "\nmissing parameter: '" + failure.subject + "'";
    if (!failure.section.empty()) {
      text += " in section '" + failure.section + "'";
    }
    text += ". every placeholder of the chosen pattern needs a param.";
  }
  return text;
}

std::string format_feedback(const repair_attempt& attempt) {
  return "attempt " + std::to_string(attempt.index) + " failed (" +
         std::string(attempt_outcome_name(attempt.outcome)) + "):\n" + attempt.diagnostic;
}

repair_loop::repair_loop(
    workflow::workflow_machine& workflow, workflow::role_gateway& gateway, library::library_catalog& catalog,
    execution::execution_runner& runner, trajectory_sink& sink, loop_options options
)
    : workflow_(workflow), gateway_(gateway), catalog_(catalog), runner_(runner), sink_(sink),
      options_(std::move(options)), log_(redlog::get_logger("f0rge.loop")) {}

std::filesystem::path repair_loop::script_path() const { return options_.work_dir / options_.script_name; }

std::filesystem::path repair_loop::artifact_path() const { return options_.work_dir / options_.artifact_name; }

cycle_report repair_loop::run_cycle(const std::string& goal, const cancellation_token* cancel) {
  cycle_report report;
  std::string feedback;

  log_.inf(
      "repair cycle started", redlog::field("max_attempts", options_.max_attempts),
      redlog::field("k", options_.candidates_k), redlog::field("work_dir", options_.work_dir.string())
  );

  for (size_t index = 1; index <= options_.max_attempts; ++index) {
    repair_attempt attempt;
    attempt.index = index;

    step next = attempt_once(goal, feedback, cancel, attempt, report);
    record(attempt);
    report.attempts.push_back(attempt);
    if (attempt.score) {
      report.final_score = attempt.score;
    }

    if (next == step::stop) {
      log_.inf(
          "repair cycle stopped", redlog::field("attempt", index),
          redlog::field("reason", std::string(stop_reason_name(report.reason))), redlog::field("success", report.success)
      );
      return report;
    }

    feedback = format_feedback(attempt);
    log_.wrn(
        "attempt failed, retrying", redlog::field("attempt", index),
        redlog::field("outcome", std::string(attempt_outcome_name(attempt.outcome)))
    );
  }

  report.success = false;
  report.reason = stop_reason::attempts_exhausted;
  report.detail = "no successful execution after " + std::to_string(options_.max_attempts) + " attempts";
  log_.err("repair cycle exhausted", redlog::field("attempts", options_.max_attempts));
  return report;
}

repair_loop::step repair_loop::attempt_once(
    const std::string& goal, const std::string& feedback, const cancellation_token* cancel, repair_attempt& attempt,
    cycle_report& report
) {
  auto stop_with = [&](stop_reason reason, std::string detail) {
    report.success = false;
    report.reason = reason;
    report.detail = std::move(detail);
    return step::stop;
  };

  // generate
  if (cancel && cancel->requested()) {
    attempt.outcome = attempt_outcome::cancelled;
    attempt.diagnostic = "cancelled before generation";
    return stop_with(stop_reason::cancelled, attempt.diagnostic);
  }

  attempt.prompt = goal;
  auto design = workflow_.run(goal, feedback, cancel);
  if (!design.ok()) {
    attempt.diagnostic = design.status.message;
    if (design.status.code == error_code::cancelled) {
      attempt.outcome = attempt_outcome::cancelled;
      return stop_with(stop_reason::cancelled, attempt.diagnostic);
    }
    attempt.outcome = attempt_outcome::generation_failed;
    if (is_retryable(design.status.code)) {
      attempt.score = options_.scoring.crash();
      return step::retry;
    }
    return stop_with(stop_reason::workflow_failed, attempt.diagnostic);
  }

  const std::string packet = workflow::render_design_packet(design.value);
  attempt.prompt = workflow_.prompts().render(
      workflow::role::plan_emission,
      param_map{
          {"backend", options_.backend_hint},
          {"metric", options_.scoring.metric()},
          {"artifact", options_.artifact_name},
          {"goal", goal},
      }
  );

  selection::generate_fn generate = [&](const std::string& prompt) {
    return gateway_.call(workflow::role::plan_emission, prompt, packet);
  };
  selection::arbitrate_fn arbitrate = [&](const std::vector<candidate>& candidates) {
    std::string prompt = workflow_.prompts().render(
        workflow::role::arbitration, param_map{{"options", selection::format_arbitration_prompt(candidates)}}
    );
    return gateway_.call(workflow::role::arbitration, prompt, packet);
  };

  auto selected = selection::select_plan(generate, arbitrate, attempt.prompt, options_.candidates_k);
  if (!selected.ok()) {
    attempt.outcome = attempt_outcome::generation_failed;
    attempt.diagnostic = selected.status.message;
    attempt.score = options_.scoring.crash();
    return stop_with(stop_reason::no_valid_candidate, attempt.diagnostic);
  }
  attempt.generated_plan = selected.value.chosen;
  const plan& chosen = *attempt.generated_plan;

  // compile
  auto backend = catalog_.backend(chosen.backend_id);
  auto library = catalog_.load(chosen.backend_id);
  if (!backend.ok() || !library.ok()) {
    attempt.outcome = attempt_outcome::compile_failed;
    attempt.diagnostic = backend.ok() ? library.status.message : backend.status.message;
    return stop_with(stop_reason::configuration_failed, attempt.diagnostic);
  }

  auto compiled = compiler::compile_plan(*library.value, chosen, options_.mode);
  if (!compiled.ok()) {
    attempt.outcome = attempt_outcome::compile_failed;
    attempt.diagnostic = describe_compile_failure(compiled.status);
    attempt.score = options_.scoring.crash();
    return step::retry;
  }
  attempt.script = compiled.value;

  // execute
  if (auto written = write_script(*attempt.script); !written.ok()) {
    attempt.outcome = attempt_outcome::infrastructure_failed;
    attempt.diagnostic = written.message;
    return stop_with(stop_reason::io_failed, attempt.diagnostic);
  }

  std::error_code ec;
  std::filesystem::remove(artifact_path(), ec);

  runner_.select_interpreter(backend.value.interpreter);
  auto ran = runner_.run(script_path(), options_.isolate, cancel);
  if (!ran.ok()) {
    attempt.outcome = attempt_outcome::infrastructure_failed;
    attempt.diagnostic = ran.status.message;
    return stop_with(
        ran.status.code == error_code::io_error ? stop_reason::io_failed : stop_reason::infrastructure_failed,
        attempt.diagnostic
    );
  }
  attempt.execution = ran.value;
  auto& execution = *attempt.execution;
  if (std::filesystem::exists(artifact_path(), ec)) {
    execution.result_artifact_path = artifact_path().string();
  }

  switch (execution.how) {
  case termination::cancelled:
    attempt.outcome = attempt_outcome::cancelled;
    attempt.diagnostic = "execution cancelled";
    return stop_with(stop_reason::cancelled, attempt.diagnostic);
  case termination::timed_out:
    attempt.outcome = attempt_outcome::timed_out;
    attempt.diagnostic = "execution timed out\n" + util::tail_text(execution.stderr_text, diagnostic_tail_bytes);
    attempt.score = options_.scoring.crash();
    return step::retry;
  case termination::signaled:
  case termination::exited:
    break;
  }

  if (!execution.succeeded()) {
    attempt.outcome = attempt_outcome::execution_failed;
    attempt.diagnostic = "script exited with " + std::to_string(execution.exit_code) + "\n" +
                         util::tail_text(execution.stderr_text, diagnostic_tail_bytes);
    attempt.score = options_.scoring.crash();
    return step::retry;
  }

  return evaluate(attempt, report);
}

repair_loop::step repair_loop::evaluate(repair_attempt& attempt, cycle_report& report) {
  attempt.outcome = attempt_outcome::succeeded;

  auto metric = evaluation::read_last_metric(artifact_path(), options_.scoring.metric());
  if (metric.ok()) {
    attempt.metric_value = metric.value;
    attempt.score = options_.scoring.score(metric.value);
    log_.inf(
        "scored execution", redlog::field("metric", options_.scoring.metric()), redlog::field("value", metric.value),
        redlog::field("label", attempt.score->label), redlog::field("reward", attempt.score->reward)
    );
  } else {
    // a clean exit that produced no metric still ends the cycle
    attempt.score = options_.scoring.crash();
    attempt.diagnostic = "no metric after clean exit: " + metric.status.message;
    log_.wrn("clean exit without metric", redlog::field("error", metric.status.message));
  }

  report.success = true;
  report.reason = stop_reason::scored;
  report.detail = attempt.score->label;
  return step::stop;
}

status repair_loop::write_script(const compiled_script& script) const {
  std::error_code ec;
  std::filesystem::create_directories(options_.work_dir, ec);
  if (ec) {
    return make_status(
        error_code::io_error, "cannot create work directory " + options_.work_dir.string() + ": " + ec.message()
    );
  }

  std::ofstream out(script_path(), std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    return make_status(error_code::io_error, "cannot open script " + script_path().string());
  }
  out << script.text();
  out.close();
  if (!out) {
    return make_status(error_code::io_error, "cannot write script " + script_path().string());
  }

  log_.dbg(
      "script written", redlog::field("path", script_path().string()), redlog::field("lines", script.lines.size())
  );
  return ok_status();
}

void repair_loop::record(const repair_attempt& attempt) {
  trajectory entry;
  entry.attempt = attempt.index;
  entry.prompt = attempt.prompt;
  entry.outcome = std::string(attempt_outcome_name(attempt.outcome));
  if (attempt.score) {
    entry.reward = attempt.score->reward;
    entry.label = attempt.score->label;
  }

  if (!attempt.diagnostic.empty()) {
    entry.transcript = attempt.diagnostic;
  } else if (attempt.execution) {
    entry.transcript = util::tail_text(attempt.execution->stdout_text, diagnostic_tail_bytes);
  }
  if (attempt.generated_plan) {
    entry.transcript += (entry.transcript.empty() ? "" : "\n") + std::string("plan: ") + dump_plan(*attempt.generated_plan);
  }

  sink_.record(entry);
}

} // namespace f0rge::loop
