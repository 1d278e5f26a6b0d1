#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace f0rge::util {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return value.substr(0, 0);
  }
  size_t last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

inline std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      if (start < text.size()) {
        lines.emplace_back(text.substr(start));
      }
      break;
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }
  return lines;
}

// keeps the tail of long process output so diagnostics stay readable
inline std::string tail_text(std::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  return "..." + std::string(text.substr(text.size() - max_bytes));
}

} // namespace f0rge::util
