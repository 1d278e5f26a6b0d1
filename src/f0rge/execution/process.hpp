#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace f0rge::execution {

struct process_spec {
  std::vector<std::string> argv;
  std::filesystem::path working_dir; // empty keeps the current directory
  std::string stdin_text;
  std::chrono::milliseconds timeout{0}; // zero waits forever
  const cancellation_token* cancel = nullptr;
};

// runs argv[0] (searched on PATH) to completion and captures its output.
// a nonzero exit, a signal, a timeout and a cancellation are all reported through
// execution_result; only a failure to spawn returns infrastructure_error.
result<execution_result> run_process(const process_spec& spec);

} // namespace f0rge::execution
