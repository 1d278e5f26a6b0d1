#include "block_extractor.hpp"
#include "util/string_utils.hpp"
#include <cctype>
#include <exception>

namespace f0rge::selection {

namespace {

constexpr std::string_view fence_open = "```json";
constexpr std::string_view fence_close = "```";

std::optional<std::string> fenced_block(std::string_view text) {
  size_t open = text.find(fence_open);
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  size_t body = open + fence_open.size();
  size_t close = text.find(fence_close, body);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  return util::trim_copy(text.substr(body, close - body));
}

} // namespace

std::optional<std::string> extract_structured_block(std::string_view text) {
  if (auto fenced = fenced_block(text)) {
    return fenced;
  }

  size_t first = text.find('{');
  size_t last = text.rfind('}');
  if (first == std::string_view::npos || last == std::string_view::npos || last < first) {
    return std::nullopt;
  }
  return std::string(text.substr(first, last - first + 1));
}

std::optional<size_t> extract_first_index(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && !std::isdigit(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  if (start == text.size()) {
    return std::nullopt;
  }
  size_t end = start;
  while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) {
    ++end;
  }

  try {
    return static_cast<size_t>(std::stoull(std::string(text.substr(start, end - start))));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace f0rge::selection
