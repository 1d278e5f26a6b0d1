#include "plan_compiler.hpp"
#include "template_substitution.hpp"
#include "util/string_utils.hpp"
#include <redlog.hpp>

namespace f0rge::compiler {

std::string section_comment(std::string_view section) { return "# == " + std::string(section) + " =="; }

std::string item_comment(const std::string& category, const item& entry) {
  std::string line = "# " + category + ": " + entry.type;
  auto id = entry.params.find("id");
  if (id != entry.params.end()) {
    line += " (ID: " + id->second + ")";
  }
  return line;
}

plan_compiler::plan_compiler(const library::pattern_library& library) : library_(library) {}

param_map plan_compiler::top_level_fields(const plan& plan) {
  param_map fields = plan.attributes;
  fields["backend_id"] = plan.backend_id;
  fields["engine"] = plan.backend_id;
  fields["model_name"] = plan.model_name;
  return fields;
}

status plan_compiler::emit_lines(
    const std::vector<std::string>& template_lines, const param_map& params, const std::string& owner,
    const std::string& section, compile_mode mode, compiled_script& out
) const {
  for (const auto& line : template_lines) {
    auto substituted = substitute(line, params);
    if (!substituted.unbound.empty()) {
      const std::string& name = substituted.unbound.front();
      if (mode == compile_mode::strict) {
        return make_status(
            error_code::unbound_placeholder,
            "unbound placeholder '{" + name + "}' in '" + owner + "' (section " + section + ")", name, section
        );
      }
      for (const auto& unbound : substituted.unbound) {
        out.warnings.push_back("unbound placeholder '{" + unbound + "}' left in '" + owner + "'");
      }
    }
    out.lines.push_back(std::move(substituted.text));
  }
  return ok_status();
}

status plan_compiler::emit_preamble(
    const std::string& section, const std::vector<std::string>& lines, const param_map& fields, compile_mode mode,
    compiled_script& out
) const {
  if (lines.empty()) {
    return ok_status();
  }
  out.lines.push_back(section_comment(section));
  auto emitted = emit_lines(lines, fields, section, section, mode, out);
  if (!emitted.ok()) {
    return emitted;
  }
  out.lines.emplace_back();
  return ok_status();
}

status plan_compiler::emit_items(stage which, const std::vector<item>& items, compile_mode mode, compiled_script& out)
    const {
  auto log = redlog::get_logger("f0rge.compiler");
  if (items.empty()) {
    return ok_status();
  }

  const std::string section(stage_name(which));
  out.lines.push_back(section_comment(section));

  for (const auto& entry : items) {
    auto found = library_.lookup(entry.type);
    if (!found.ok()) {
      if (mode == compile_mode::strict) {
        log.dbg("missing pattern", redlog::field("type", entry.type), redlog::field("section", section));
        return make_status(
            error_code::missing_pattern,
            "type '" + entry.type + "' in section '" + section + "' has no pattern in the '" + library_.backend_id() +
                "' library",
            entry.type, section
        );
      }
      std::string warning = "no pattern for type '" + entry.type + "' in section '" + section + "', skipped";
      out.lines.push_back("# WARNING: " + warning);
      out.warnings.push_back(std::move(warning));
      continue;
    }

    const pattern& resolved = found.value;
    out.lines.push_back(item_comment(resolved.category, entry));
    auto emitted = emit_lines(resolved.template_lines, entry.params, entry.type, section, mode, out);
    if (!emitted.ok()) {
      return emitted;
    }
    out.lines.emplace_back();
  }

  out.lines.emplace_back();
  return ok_status();
}

result<compiled_script> plan_compiler::compile(const plan& plan, compile_mode mode) const {
  auto log = redlog::get_logger("f0rge.compiler");

  if (util::to_lower(plan.backend_id) != util::to_lower(library_.backend_id())) {
    return error_result<compiled_script>(make_status(
        error_code::invalid_argument,
        "plan targets backend '" + plan.backend_id + "' but library is '" + library_.backend_id() + "'",
        plan.backend_id
    ));
  }

  compiled_script out;
  const param_map fields = top_level_fields(plan);

  auto fail = [](status failure) { return error_result<compiled_script>(std::move(failure)); };

  if (auto emitted = emit_preamble("imports", library_.imports(), fields, mode, out); !emitted.ok()) {
    return fail(emitted);
  }
  if (auto emitted = emit_preamble("init", library_.init(), fields, mode, out); !emitted.ok()) {
    return fail(emitted);
  }

  for (stage which : all_stages) {
    if (which == stage::analyze && library_.analyze() == library::analyze_shape::command_list) {
      if (auto emitted = emit_preamble("analyze", library_.analyze_commands(), fields, mode, out); !emitted.ok()) {
        return fail(emitted);
      }
      if (plan.has_stage(stage::analyze)) {
        out.warnings.push_back("plan analyze items ignored: library uses a fixed analyze command list");
      }
      continue;
    }

    auto it = plan.stages.find(which);
    if (it == plan.stages.end()) {
      continue;
    }
    if (auto emitted = emit_items(which, it->second, mode, out); !emitted.ok()) {
      return fail(emitted);
    }
  }

  log.dbg(
      "compiled plan", redlog::field("backend", library_.backend_id()), redlog::field("model", plan.model_name),
      redlog::field("lines", out.lines.size()), redlog::field("warnings", out.warnings.size())
  );
  return ok_result(std::move(out));
}

result<compiled_script> compile_plan(const library::pattern_library& library, const plan& plan, compile_mode mode) {
  return plan_compiler(library).compile(plan, mode);
}

} // namespace f0rge::compiler
