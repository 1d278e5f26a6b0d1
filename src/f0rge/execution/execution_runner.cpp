#include "execution_runner.hpp"
#include "process.hpp"
#include <redlog.hpp>
#include <system_error>

namespace f0rge::execution {

process_runner::process_runner(runner_config config)
    : config_(std::move(config)), configured_interpreter_(config_.interpreter) {}

void process_runner::select_interpreter(const std::vector<std::string>& interpreter) {
  config_.interpreter = interpreter.empty() ? configured_interpreter_ : interpreter;
}

std::vector<std::string> process_runner::build_command(const std::filesystem::path& script_path, bool isolate) const {
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(script_path, ec);
  if (ec) {
    absolute = script_path;
  }
  const std::string work_dir = absolute.parent_path().string();

  std::vector<std::string> command;
  if (isolate) {
    command = config_.isolation.runtime;
    command.push_back("-v");
    command.push_back(work_dir + ":" + work_dir);
    command.push_back("-w");
    command.push_back(work_dir);
    command.push_back(config_.isolation.image);
  }
  command.insert(command.end(), config_.interpreter.begin(), config_.interpreter.end());
  command.push_back(absolute.string());
  return command;
}

result<execution_result> process_runner::run(
    const std::filesystem::path& script_path, bool isolate, const cancellation_token* cancel
) {
  auto log = redlog::get_logger("f0rge.runner");

  std::error_code ec;
  if (!std::filesystem::exists(script_path, ec)) {
    log.err("script not found", redlog::field("path", script_path.string()));
    return error_result<execution_result>(error_code::io_error, "script not found: " + script_path.string());
  }

  process_spec spec;
  spec.argv = build_command(script_path, isolate);
  spec.working_dir = std::filesystem::absolute(script_path, ec).parent_path();
  spec.timeout = config_.timeout;
  spec.cancel = cancel;

  log.inf(
      "executing script", redlog::field("script", script_path.string()), redlog::field("isolate", isolate),
      redlog::field("launcher", spec.argv.front())
  );

  auto ran = run_process(spec);
  if (!ran.ok()) {
    return ran;
  }

  if (ran.value.how == termination::exited && ran.value.exit_code == 0) {
    log.inf("script finished", redlog::field("duration_ms", ran.value.duration_ms));
  } else {
    log.wrn(
        "script did not finish cleanly", redlog::field("exit_code", ran.value.exit_code),
        redlog::field("termination", std::string(termination_name(ran.value.how)))
    );
  }
  return ran;
}

} // namespace f0rge::execution
