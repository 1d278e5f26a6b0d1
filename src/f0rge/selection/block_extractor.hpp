#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace f0rge::selection {

// pulls the single structured block out of generator output: a ```json fenced block when
// present, otherwise the span from the first '{' to the last '}'
std::optional<std::string> extract_structured_block(std::string_view text);

// first run of decimal digits in the text, if any fits in a size_t
std::optional<size_t> extract_first_index(std::string_view text);

} // namespace f0rge::selection
