#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace f0rge::execution {

// runs a compiled script and reports how it ended
class execution_runner {
public:
  virtual ~execution_runner() = default;

  virtual result<execution_result> run(
      const std::filesystem::path& script_path, bool isolate, const cancellation_token* cancel = nullptr
  ) = 0;

  // backend-specific interpreter for the following runs; empty restores the configured one
  virtual void select_interpreter(const std::vector<std::string>& interpreter) { (void) interpreter; }
};

struct isolation_config {
  std::vector<std::string> runtime{"docker", "run", "--rm"};
  std::string image = "python:3.11-slim";
};

struct runner_config {
  std::vector<std::string> interpreter{"python3"};
  isolation_config isolation;
  std::chrono::milliseconds timeout{0};
};

// spawns the interpreter on the script, either directly or inside a container that
// mounts the script's directory read/write at the same path
class process_runner : public execution_runner {
public:
  explicit process_runner(runner_config config);

  result<execution_result> run(
      const std::filesystem::path& script_path, bool isolate, const cancellation_token* cancel = nullptr
  ) override;

  std::vector<std::string> build_command(const std::filesystem::path& script_path, bool isolate) const;

  const runner_config& config() const noexcept { return config_; }
  void select_interpreter(const std::vector<std::string>& interpreter) override;

private:
  runner_config config_;
  std::vector<std::string> configured_interpreter_;
};

} // namespace f0rge::execution
