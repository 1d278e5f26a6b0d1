#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace f0rge::compiler {

struct substitution {
  std::string text;
  std::vector<std::string> unbound; // placeholder names with no matching param, in order of appearance
};

// replaces {name} with params[name] as literal text; {{ and }} emit single braces,
// unbound placeholders are left verbatim and reported. a placeholder carrying a format
// spec or conversion ({name:.2f}, {name!r}) is always unbound
substitution substitute(std::string_view line, const param_map& params);

bool is_placeholder_name(std::string_view name) noexcept;

} // namespace f0rge::compiler
