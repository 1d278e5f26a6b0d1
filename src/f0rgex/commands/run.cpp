#include "run.hpp"
#include "common.hpp"
#include <f0rge/compiler/plan_compiler.hpp>
#include <f0rge/evaluation/result_artifact.hpp>
#include <f0rge/execution/execution_runner.hpp>
#include <f0rge/util/string_utils.hpp>
#include <fstream>
#include <iostream>
#include <redlog.hpp>

namespace f0rgex::commands {

int run(const run_request& request) {
  auto log = redlog::get_logger("f0rgex.run");

  auto config = resolve_config(request.config_path);
  if (!config.ok()) {
    print_failure("configuration", config.status);
    return 1;
  }
  auto& options = config.value.loop;
  if (!request.work_dir.empty()) {
    options.work_dir = request.work_dir;
  }

  auto plan = read_plan_file(request.plan_path);
  if (!plan.ok()) {
    print_failure("plan", plan.status);
    return 1;
  }

  auto catalog = f0rge::config::make_catalog(config.value);
  auto backend = catalog.backend(plan.value.backend_id);
  auto library = catalog.load(plan.value.backend_id);
  if (!backend.ok() || !library.ok()) {
    print_failure("library", backend.ok() ? library.status : backend.status);
    return 1;
  }

  auto script = f0rge::compiler::compile_plan(*library.value, plan.value, options.mode);
  if (!script.ok()) {
    print_failure("compile", script.status);
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(options.work_dir, ec);
  auto script_path = options.work_dir / options.script_name;
  auto artifact_path = options.work_dir / options.artifact_name;
  {
    std::ofstream out(script_path, std::ios::out | std::ios::trunc);
    if (!out) {
      std::cerr << "error: cannot write script: " << script_path.string() << std::endl;
      return 1;
    }
    out << script.value.text();
  }
  std::filesystem::remove(artifact_path, ec);

  f0rge::execution::process_runner runner(config.value.runner);
  runner.select_interpreter(backend.value.interpreter);
  auto ran = runner.run(script_path, request.isolate || options.isolate);
  if (!ran.ok()) {
    print_failure("execution", ran.status);
    return 1;
  }

  const auto& outcome = ran.value;
  std::cout << outcome.stdout_text;
  if (!outcome.succeeded()) {
    std::cerr << outcome.stderr_text;
    std::cerr << "execution " << f0rge::termination_name(outcome.how) << " with exit code " << outcome.exit_code
              << std::endl;
    std::cout << "score: " << options.scoring.crash().label << " (" << options.scoring.crash().reward << ")"
              << std::endl;
    return 1;
  }

  auto metric = f0rge::evaluation::read_last_metric(artifact_path, options.scoring.metric());
  auto score = metric.ok() ? options.scoring.score(metric.value) : options.scoring.crash();
  if (!metric.ok()) {
    log.wrn("no metric after clean exit", redlog::field("error", metric.status.message));
  } else {
    std::cout << options.scoring.metric() << ": " << metric.value << std::endl;
  }
  std::cout << "score: " << score.label << " (" << score.reward << ")" << std::endl;
  return 0;
}

} // namespace f0rgex::commands
