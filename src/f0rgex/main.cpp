#include "commands/check.hpp"
#include "commands/compile.hpp"
#include "commands/cycle.hpp"
#include "commands/run.hpp"
#include <args.hxx>
#include <f0rge/util/verbosity.hpp>
#include <iostream>
#include <redlog.hpp>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { f0rge::util::apply_verbosity(args::get(verbosity_flag)); }

std::string value_or_empty(args::ValueFlag<std::string>& flag) { return flag ? args::get(flag) : std::string(); }
} // namespace cli

int cmd_compile(
    args::ValueFlag<std::string>& plan_flag, args::ValueFlag<std::string>& backend_flag,
    args::ValueFlag<std::string>& config_flag, args::ValueFlag<std::string>& output_flag, args::Flag& tolerant_flag
) {
  auto log = redlog::get_logger("f0rgex.compile");
  cli::apply_verbosity();

  if (!plan_flag) {
    log.err("plan file required");
    std::cerr << "error: plan file (-p/--plan) is required" << std::endl;
    return 1;
  }

  f0rgex::commands::compile_request request;
  request.plan_path = args::get(plan_flag);
  request.backend = cli::value_or_empty(backend_flag);
  request.config_path = cli::value_or_empty(config_flag);
  request.output_path = cli::value_or_empty(output_flag);
  request.tolerant = args::get(tolerant_flag);
  return f0rgex::commands::compile(request);
}

int cmd_run(
    args::ValueFlag<std::string>& plan_flag, args::ValueFlag<std::string>& config_flag,
    args::ValueFlag<std::string>& work_dir_flag, args::Flag& isolate_flag
) {
  auto log = redlog::get_logger("f0rgex.run");
  cli::apply_verbosity();

  if (!plan_flag) {
    log.err("plan file required");
    std::cerr << "error: plan file (-p/--plan) is required" << std::endl;
    return 1;
  }

  f0rgex::commands::run_request request;
  request.plan_path = args::get(plan_flag);
  request.config_path = cli::value_or_empty(config_flag);
  request.work_dir = cli::value_or_empty(work_dir_flag);
  request.isolate = args::get(isolate_flag);
  return f0rgex::commands::run(request);
}

int cmd_cycle(
    args::ValueFlag<std::string>& config_flag, args::ValueFlag<std::string>& goal_flag,
    args::ValueFlag<std::string>& work_dir_flag, args::ValueFlag<int>& attempts_flag,
    args::ValueFlag<int>& candidates_flag, args::Flag& isolate_flag
) {
  cli::apply_verbosity();

  f0rgex::commands::cycle_request request;
  request.config_path = cli::value_or_empty(config_flag);
  request.goal = cli::value_or_empty(goal_flag);
  request.work_dir = cli::value_or_empty(work_dir_flag);
  request.max_attempts = attempts_flag ? args::get(attempts_flag) : 0;
  request.candidates = candidates_flag ? args::get(candidates_flag) : 0;
  request.isolate = args::get(isolate_flag);
  return f0rgex::commands::cycle(request);
}

int cmd_check(args::ValueFlag<std::string>& backend_flag, args::ValueFlag<std::string>& config_flag) {
  auto log = redlog::get_logger("f0rgex.check");
  cli::apply_verbosity();

  if (!backend_flag) {
    log.err("backend required");
    std::cerr << "error: backend (-b/--backend) is required" << std::endl;
    return 1;
  }
  return f0rgex::commands::check(args::get(backend_flag), cli::value_or_empty(config_flag));
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("f0rgex - simulation plan compiler and repair loop");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  parser.Add(cli::arguments);

  // compile command
  args::Command compile_cmd(parser, "compile", "compile a plan document to a backend script");
  args::ValueFlag<std::string> compile_plan_flag(compile_cmd, "plan", "plan json path", {'p', "plan"});
  args::ValueFlag<std::string> compile_backend_flag(
      compile_cmd, "backend", "backend id (default: the plan's backend_id)", {'b', "backend"}
  );
  args::ValueFlag<std::string> compile_config_flag(compile_cmd, "config", "configuration json path", {'c', "config"});
  args::ValueFlag<std::string> compile_output_flag(
      compile_cmd, "output", "output script path (default: stdout)", {'o', "output"}
  );
  args::Flag compile_tolerant_flag(compile_cmd, "tolerant", "skip unknown types instead of failing", {"tolerant"});

  // run command
  args::Command run_cmd(parser, "run", "compile, execute and score a plan once");
  args::ValueFlag<std::string> run_plan_flag(run_cmd, "plan", "plan json path", {'p', "plan"});
  args::ValueFlag<std::string> run_config_flag(run_cmd, "config", "configuration json path", {'c', "config"});
  args::ValueFlag<std::string> run_work_dir_flag(run_cmd, "dir", "work directory", {'w', "work-dir"});
  args::Flag run_isolate_flag(run_cmd, "isolate", "run inside the container runtime", {"isolate"});

  // cycle command
  args::Command cycle_cmd(parser, "cycle", "run the generate/compile/execute/evaluate repair loop");
  args::ValueFlag<std::string> cycle_config_flag(cycle_cmd, "config", "configuration json path", {'c', "config"});
  args::ValueFlag<std::string> cycle_goal_flag(cycle_cmd, "goal", "experiment goal", {'g', "goal"});
  args::ValueFlag<std::string> cycle_work_dir_flag(cycle_cmd, "dir", "work directory", {'w', "work-dir"});
  args::ValueFlag<int> cycle_attempts_flag(cycle_cmd, "n", "maximum repair attempts", {"max-attempts"});
  args::ValueFlag<int> cycle_candidates_flag(cycle_cmd, "k", "plan candidates per attempt", {'k', "candidates"});
  args::Flag cycle_isolate_flag(cycle_cmd, "isolate", "run inside the container runtime", {"isolate"});

  // check command
  args::Command check_cmd(parser, "check", "validate a backend pattern library and list its patterns");
  args::ValueFlag<std::string> check_backend_flag(check_cmd, "backend", "backend id", {'b', "backend"});
  args::ValueFlag<std::string> check_config_flag(check_cmd, "config", "configuration json path", {'c', "config"});

  try {
    parser.ParseCLI(argc, argv);

    if (compile_cmd) {
      return cmd_compile(
          compile_plan_flag, compile_backend_flag, compile_config_flag, compile_output_flag, compile_tolerant_flag
      );
    } else if (run_cmd) {
      return cmd_run(run_plan_flag, run_config_flag, run_work_dir_flag, run_isolate_flag);
    } else if (cycle_cmd) {
      return cmd_cycle(
          cycle_config_flag, cycle_goal_flag, cycle_work_dir_flag, cycle_attempts_flag, cycle_candidates_flag,
          cycle_isolate_flag
      );
    } else if (check_cmd) {
      return cmd_check(check_backend_flag, check_config_flag);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
