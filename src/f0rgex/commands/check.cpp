#include "check.hpp"
#include "common.hpp"
#include <iostream>
#include <redlog.hpp>

namespace f0rgex::commands {

int check(const std::string& backend, const std::string& config_path) {
  auto log = redlog::get_logger("f0rgex.check");

  auto config = resolve_config(config_path);
  if (!config.ok()) {
    print_failure("configuration", config.status);
    return 1;
  }

  auto catalog = f0rge::config::make_catalog(config.value);
  auto library = catalog.load(backend);
  if (!library.ok()) {
    print_failure("library", library.status);
    return 1;
  }

  const auto& lib = *library.value;
  std::cout << "backend: " << lib.backend_id() << std::endl;
  std::cout << "imports: " << lib.imports().size() << " lines, init: " << lib.init().size() << " lines" << std::endl;
  switch (lib.analyze()) {
  case f0rge::library::analyze_shape::absent:
    std::cout << "analyze: none" << std::endl;
    break;
  case f0rge::library::analyze_shape::command_list:
    std::cout << "analyze: " << lib.analyze_commands().size() << " fixed lines" << std::endl;
    break;
  case f0rge::library::analyze_shape::pattern_map:
    std::cout << "analyze: patterns" << std::endl;
    break;
  }

  for (const auto& category : lib.categories()) {
    std::cout << category << ":" << std::endl;
    for (const auto& entry : lib.patterns_in(category)) {
      std::cout << "  " << entry.type_name << " (" << entry.template_lines.size() << " lines)" << std::endl;
    }
  }

  log.inf("library ok", redlog::field("backend", lib.backend_id()), redlog::field("patterns", lib.pattern_count()));
  return 0;
}

} // namespace f0rgex::commands
