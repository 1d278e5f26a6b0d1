#include "result_artifact.hpp"
#include "util/string_utils.hpp"
#include <redlog.hpp>
#include <cmath>
#include <exception>
#include <fstream>

namespace f0rge::evaluation {

std::vector<std::string> split_csv_record(std::string_view line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char ch = line[i];
    if (quoted) {
      if (ch == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        current += ch;
      }
      continue;
    }

    if (ch == '"') {
      quoted = true;
    } else if (ch == ',') {
      fields.push_back(util::trim_copy(current));
      current.clear();
    } else if (ch != '\r') {
      current += ch;
    }
  }
  fields.push_back(util::trim_copy(current));
  return fields;
}

result<double> parse_metric_value(std::string_view text) {
  std::string trimmed = util::trim_copy(text);
  if (trimmed.empty()) {
    return error_result<double>(error_code::parse_error, "metric value is empty");
  }

  try {
    size_t consumed = 0;
    double value = std::stod(trimmed, &consumed);
    if (consumed != trimmed.size() || std::isnan(value)) {
      return error_result<double>(error_code::parse_error, "metric value '" + trimmed + "' is not a number");
    }
    return ok_result(value);
  } catch (const std::exception&) {
    return error_result<double>(error_code::parse_error, "metric value '" + trimmed + "' is not a number");
  }
}

result<double> read_last_metric(const std::filesystem::path& artifact, const std::string& metric) {
  auto log = redlog::get_logger("f0rge.artifact");

  std::ifstream input(artifact);
  if (!input) {
    log.dbg("result artifact missing", redlog::field("path", artifact.string()));
    return error_result<double>(error_code::io_error, "result artifact not found: " + artifact.string());
  }

  std::string line;
  std::vector<std::string> header;
  while (header.empty() && std::getline(input, line)) {
    if (!util::trim_view(line).empty()) {
      header = split_csv_record(line);
    }
  }
  if (header.empty()) {
    return error_result<double>(error_code::parse_error, "result artifact is empty: " + artifact.string());
  }

  size_t column = header.size();
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == metric) {
      column = i;
      break;
    }
  }
  if (column == header.size()) {
    return error_result<double>(
        make_status(error_code::not_found, "metric '" + metric + "' not in result artifact", metric)
    );
  }

  std::string last_row;
  while (std::getline(input, line)) {
    if (!util::trim_view(line).empty()) {
      last_row = line;
    }
  }
  if (last_row.empty()) {
    return error_result<double>(error_code::parse_error, "result artifact has no data rows");
  }

  auto fields = split_csv_record(last_row);
  if (column >= fields.size()) {
    return error_result<double>(
        make_status(error_code::parse_error, "last row has no value for metric '" + metric + "'", metric)
    );
  }
  return parse_metric_value(fields[column]);
}

} // namespace f0rge::evaluation
