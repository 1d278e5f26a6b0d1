#pragma once

#include <string>

namespace f0rgex::commands {

struct cycle_request {
  std::string config_path;
  std::string goal;     // overrides the configured goal when set
  std::string work_dir; // overrides the configured work directory when set
  int max_attempts = 0; // 0 keeps the configured value
  int candidates = 0;   // 0 keeps the configured value
  bool isolate = false;
};

// run the full repair loop with command-backed roles; ctrl-c cancels the cycle
int cycle(const cycle_request& request);

} // namespace f0rgex::commands
