#pragma once

#include "core/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace f0rge::evaluation {

// splits one csv record; double quotes group fields and "" escapes a quote
std::vector<std::string> split_csv_record(std::string_view line);

// value of `metric` in the last data row of a csv file with a header row
result<double> read_last_metric(const std::filesystem::path& artifact, const std::string& metric);

result<double> parse_metric_value(std::string_view text);

} // namespace f0rge::evaluation
