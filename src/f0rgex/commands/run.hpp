#pragma once

#include <string>

namespace f0rgex::commands {

struct run_request {
  std::string plan_path;
  std::string config_path;
  std::string work_dir; // overrides the configured work directory when set
  bool isolate = false;
};

// compile, execute and score one plan without the repair loop
int run(const run_request& request);

} // namespace f0rgex::commands
