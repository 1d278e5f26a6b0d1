#include "template_substitution.hpp"
#include <cctype>

namespace f0rge::compiler {

namespace {

bool is_name_start(char ch) { return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_'; }

bool is_name_char(char ch) { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_'; }

// {name:spec} or {name!conversion}; params are plain text so these can never bind
bool has_format_suffix(std::string_view field) {
  size_t split = field.find_first_of(":!");
  return split != std::string_view::npos && is_placeholder_name(field.substr(0, split));
}

} // namespace

bool is_placeholder_name(std::string_view name) noexcept {
  if (name.empty() || !is_name_start(name.front())) {
    return false;
  }
  for (char ch : name) {
    if (!is_name_char(ch)) {
      return false;
    }
  }
  return true;
}

substitution substitute(std::string_view line, const param_map& params) {
  substitution out;
  out.text.reserve(line.size());

  size_t pos = 0;
  while (pos < line.size()) {
    char ch = line[pos];

    if (ch == '{' && pos + 1 < line.size() && line[pos + 1] == '{') {
      out.text += '{';
      pos += 2;
      continue;
    }
    if (ch == '}' && pos + 1 < line.size() && line[pos + 1] == '}') {
      out.text += '}';
      pos += 2;
      continue;
    }

    if (ch == '{') {
      size_t close = line.find('}', pos + 1);
      if (close != std::string_view::npos) {
        std::string_view name = line.substr(pos + 1, close - pos - 1);
        if (is_placeholder_name(name)) {
          auto it = params.find(std::string(name));
          if (it != params.end()) {
            out.text += it->second;
          } else {
            out.unbound.emplace_back(name);
            out.text.append(line.substr(pos, close - pos + 1));
          }
          pos = close + 1;
          continue;
        }
        if (has_format_suffix(name)) {
          out.unbound.emplace_back(name);
          out.text.append(line.substr(pos, close - pos + 1));
          pos = close + 1;
          continue;
        }
      }
    }

    out.text += ch;
    ++pos;
  }
  return out;
}

} // namespace f0rge::compiler
