#include "cycle.hpp"
#include "common.hpp"
#include <f0rge/core/cancellation.hpp>
#include <f0rge/execution/execution_runner.hpp>
#include <f0rge/loop/repair_loop.hpp>
#include <f0rge/loop/trajectory_sink.hpp>
#include <f0rge/workflow/workflow_machine.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <redlog.hpp>

namespace f0rgex::commands {

namespace {

f0rge::cancellation_token g_cancel;

void on_interrupt(int) { g_cancel.request(); }

} // namespace

int cycle(const cycle_request& request) {
  auto log = redlog::get_logger("f0rgex.cycle");

  auto config = resolve_config(request.config_path);
  if (!config.ok()) {
    print_failure("configuration", config.status);
    return 1;
  }
  auto& cfg = config.value;
  if (!request.goal.empty()) {
    cfg.goal = request.goal;
  }
  if (!request.work_dir.empty()) {
    cfg.loop.work_dir = request.work_dir;
  }
  if (request.max_attempts > 0) {
    cfg.loop.max_attempts = static_cast<size_t>(request.max_attempts);
  }
  if (request.candidates > 0) {
    cfg.loop.candidates_k = static_cast<size_t>(request.candidates);
  }
  cfg.loop.isolate = cfg.loop.isolate || request.isolate;

  if (cfg.goal.empty()) {
    std::cerr << "error: no goal given (--goal, the config file or F0RGE_GOAL)" << std::endl;
    return 1;
  }
  if (cfg.roles.default_command.empty() && cfg.roles.commands.empty()) {
    std::cerr << "error: no role commands configured (roles in the config file or F0RGE_ROLE_COMMAND)" << std::endl;
    return 1;
  }

  g_cancel.reset();
  std::signal(SIGINT, on_interrupt);
  std::signal(SIGTERM, on_interrupt);

  f0rge::workflow::command_role_gateway gateway(cfg.roles, &g_cancel);
  f0rge::workflow::workflow_machine workflow(gateway, f0rge::config::make_prompt_book(cfg), cfg.workflow);
  auto catalog = f0rge::config::make_catalog(cfg);
  f0rge::execution::process_runner runner(cfg.runner);

  f0rge::loop::fanout_trajectory_sink sinks;
  sinks.add(std::make_shared<f0rge::loop::log_trajectory_sink>());
  if (!cfg.trajectory_log.empty()) {
    sinks.add(std::make_shared<f0rge::loop::jsonl_trajectory_sink>(cfg.trajectory_log));
  }

  f0rge::loop::repair_loop loop(workflow, gateway, catalog, runner, sinks, cfg.loop);
  auto report = loop.run_cycle(cfg.goal, &g_cancel);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  std::cout << "cycle: " << f0rge::loop::stop_reason_name(report.reason) << " after " << report.attempts.size()
            << " attempt(s)" << std::endl;
  if (report.final_score) {
    std::cout << "score: " << report.final_score->label << " (" << report.final_score->reward << ")" << std::endl;
  }
  if (!report.success && !report.detail.empty()) {
    std::cerr << report.detail << std::endl;
  }

  log.inf(
      "cycle finished", redlog::field("success", report.success),
      redlog::field("reason", std::string(f0rge::loop::stop_reason_name(report.reason))),
      redlog::field("attempts", report.attempts.size())
  );
  return report.success ? 0 : 1;
}

} // namespace f0rgex::commands
