#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "library/pattern_library.hpp"
#include <string>
#include <vector>

namespace f0rge::compiler {

// compiles a plan into backend script text using one backend's pattern library.
// output order is imports, init, structure, materials, physics, setup, analyze, results
// whatever order the plan document used.
class plan_compiler {
public:
  explicit plan_compiler(const library::pattern_library& library);

  result<compiled_script> compile(const plan& plan, compile_mode mode) const;

  // fields visible to the imports, init and list-form analyze templates
  static param_map top_level_fields(const plan& plan);

private:
  const library::pattern_library& library_;

  status emit_preamble(
      const std::string& section, const std::vector<std::string>& lines, const param_map& fields, compile_mode mode,
      compiled_script& out
  ) const;
  status emit_items(stage which, const std::vector<item>& items, compile_mode mode, compiled_script& out) const;
  status emit_lines(
      const std::vector<std::string>& template_lines, const param_map& params, const std::string& owner,
      const std::string& section, compile_mode mode, compiled_script& out
  ) const;
};

result<compiled_script> compile_plan(const library::pattern_library& library, const plan& plan, compile_mode mode);

std::string section_comment(std::string_view section);
std::string item_comment(const std::string& category, const item& entry);

} // namespace f0rge::compiler
