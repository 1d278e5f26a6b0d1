#pragma once

#include <string>

namespace f0rgex::commands {

// load and validate one backend library, then list its categories and patterns
int check(const std::string& backend, const std::string& config_path);

} // namespace f0rgex::commands
