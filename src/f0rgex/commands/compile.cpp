#include "compile.hpp"
#include "common.hpp"
#include <f0rge/compiler/plan_compiler.hpp>
#include <fstream>
#include <iostream>
#include <redlog.hpp>

namespace f0rgex::commands {

int compile(const compile_request& request) {
  auto log = redlog::get_logger("f0rgex.compile");

  auto config = resolve_config(request.config_path);
  if (!config.ok()) {
    print_failure("configuration", config.status);
    return 1;
  }

  auto plan = read_plan_file(request.plan_path);
  if (!plan.ok()) {
    print_failure("plan", plan.status);
    return 1;
  }
  if (!request.backend.empty()) {
    plan.value.backend_id = request.backend;
  }

  auto catalog = f0rge::config::make_catalog(config.value);
  auto library = catalog.load(plan.value.backend_id);
  if (!library.ok()) {
    print_failure("library", library.status);
    return 1;
  }

  auto mode = request.tolerant ? f0rge::compile_mode::tolerant : config.value.loop.mode;
  auto script = f0rge::compiler::compile_plan(*library.value, plan.value, mode);
  if (!script.ok()) {
    print_failure("compile", script.status);
    return 1;
  }

  for (const auto& warning : script.value.warnings) {
    std::cerr << "warning: " << warning << std::endl;
  }

  if (request.output_path.empty()) {
    std::cout << script.value.text();
    return 0;
  }

  std::ofstream out(request.output_path, std::ios::out | std::ios::trunc);
  if (!out) {
    std::cerr << "error: cannot create output file: " << request.output_path << std::endl;
    return 1;
  }
  out << script.value.text();
  log.inf(
      "script written", redlog::field("path", request.output_path), redlog::field("lines", script.value.lines.size()),
      redlog::field("warnings", script.value.warnings.size())
  );
  return 0;
}

} // namespace f0rgex::commands
