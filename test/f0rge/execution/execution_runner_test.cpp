#include <doctest/doctest.h>

#include "f0rge/execution/execution_runner.hpp"
#include "test_helpers.hpp"

namespace {

using f0rge::error_code;
using f0rge::execution::process_runner;
using f0rge::execution::runner_config;
using f0rge::test_helpers::scoped_temp_dir;
using f0rge::test_helpers::write_file;

runner_config shell_config() {
  runner_config config;
  config.interpreter = {"/bin/sh"};
  return config;
}

} // namespace

TEST_CASE("runner executes the script in its own directory") {
  scoped_temp_dir dir;
  write_file(dir / "current_run.py", "echo volts > current_run.csv\necho 1500 >> current_run.csv\necho done\n");

  process_runner runner(shell_config());
  auto ran = runner.run(dir / "current_run.py", false);
  REQUIRE(ran.ok());
  CHECK(ran.value.succeeded());
  CHECK(ran.value.stdout_text == "done\n");
  CHECK(std::filesystem::exists(dir / "current_run.csv"));
}

TEST_CASE("runner treats a nonzero exit as a normal outcome") {
  scoped_temp_dir dir;
  write_file(dir / "current_run.py", "echo 'Traceback: boom' >&2\nexit 1\n");

  process_runner runner(shell_config());
  auto ran = runner.run(dir / "current_run.py", false);
  REQUIRE(ran.ok());
  CHECK(ran.value.exit_code == 1);
  CHECK(ran.value.stderr_text.find("boom") != std::string::npos);
}

TEST_CASE("runner reports a missing interpreter as an infrastructure error") {
  scoped_temp_dir dir;
  write_file(dir / "current_run.py", "print('x')\n");

  runner_config config;
  config.interpreter = {"/nonexistent/python"};
  process_runner runner(config);
  CHECK(runner.run(dir / "current_run.py", false).status.code == error_code::infrastructure_error);
}

TEST_CASE("runner reports a missing script") {
  process_runner runner(shell_config());
  CHECK(runner.run("/nonexistent/f0rge/current_run.py", false).status.code == error_code::io_error);
}

TEST_CASE("isolated command mounts the script directory") {
  runner_config config;
  config.isolation.runtime = {"podman", "run", "--rm"};
  config.isolation.image = "python:3.11-slim";
  process_runner runner(config);

  auto command = runner.build_command("/work/exp/current_run.py", true);
  std::vector<std::string> expected{"podman", "run", "--rm", "-v", "/work/exp:/work/exp", "-w", "/work/exp",
                                    "python:3.11-slim", "python3", "/work/exp/current_run.py"};
  CHECK(command == expected);

  auto direct = runner.build_command("/work/exp/current_run.py", false);
  CHECK(direct == std::vector<std::string>{"python3", "/work/exp/current_run.py"});
}

TEST_CASE("runner switches interpreter per backend") {
  runner_config config;
  config.interpreter = {"python"};
  process_runner runner(config);
  runner.select_interpreter({"python3", "-u"});
  CHECK(runner.build_command("/w/s.py", false) == std::vector<std::string>{"python3", "-u", "/w/s.py"});

  // a backend without its own interpreter runs the configured one again
  runner.select_interpreter({});
  CHECK(runner.build_command("/w/s.py", false) == std::vector<std::string>{"python", "/w/s.py"});
}
