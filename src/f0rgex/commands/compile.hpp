#pragma once

#include <string>

namespace f0rgex::commands {

struct compile_request {
  std::string plan_path;
  std::string backend;      // overrides the plan's backend_id when set
  std::string config_path;
  std::string output_path;  // stdout when empty
  bool tolerant = false;
};

// compile a plan document to script text; 0 on success, 1 on failure
int compile(const compile_request& request);

} // namespace f0rgex::commands
