#pragma once

#include "result.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace f0rge {

// parse a plan document; stages may sit under "stages" or at the top level
result<plan> parse_plan(std::string_view text);
result<plan> parse_plan_document(const nlohmann::json& document);

// canonical form used for arbitration prompts and trajectory logs
nlohmann::ordered_json plan_to_json(const plan& value);
std::string dump_plan(const plan& value, int indent = -1);

// string values are taken verbatim, anything else as compact json text
std::string scalar_text(const nlohmann::json& value);

} // namespace f0rge
