#include "pattern_library.hpp"
#include <nlohmann/json.hpp>
#include <redlog.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace f0rge::library {

namespace {

using json = nlohmann::ordered_json;

result<std::vector<std::string>> read_lines(const json& node, const std::string& where) {
  if (!node.is_array()) {
    return error_result<std::vector<std::string>>(
        make_status(error_code::config_error, "'" + where + "' must be an array of strings", where)
    );
  }
  std::vector<std::string> lines;
  lines.reserve(node.size());
  for (const auto& line : node) {
    if (!line.is_string()) {
      return error_result<std::vector<std::string>>(
          make_status(error_code::config_error, "'" + where + "' contains a non-string line", where)
      );
    }
    lines.push_back(line.get<std::string>());
  }
  return ok_result(std::move(lines));
}

} // namespace

library_schema library_schema::defaults() {
  library_schema schema;
  schema.pattern_categories = {"geometry_shapes", "components", "structure",  "materials", "physics", "boundary_conditions",
                               "mesh",            "studies",    "setup",      "analyze",   "results", "exports"};
  return schema;
}

bool library_schema::allows(std::string_view category) const {
  return std::find(pattern_categories.begin(), pattern_categories.end(), category) != pattern_categories.end();
}

result<pattern_library> pattern_library::parse(
    std::string backend_id, std::string_view document, const library_schema& schema
) {
  auto log = redlog::get_logger("f0rge.library");

  json root;
  try {
    root = json::parse(document.begin(), document.end());
  } catch (const json::parse_error& e) {
    log.err("library document is not valid json", redlog::field("backend", backend_id), redlog::field("error", e.what()));
    return error_result<pattern_library>(
        error_code::config_error, "library for '" + backend_id + "' is malformed: " + e.what()
    );
  }

  if (!root.is_object()) {
    return error_result<pattern_library>(
        error_code::config_error, "library for '" + backend_id + "' must be a json object"
    );
  }

  pattern_library lib;
  lib.backend_id_ = std::move(backend_id);
  bool saw_init = false;
  std::unordered_map<std::string, std::string> first_category;

  auto add_category = [&](const std::string& name, const json& node) -> status {
    if (!node.is_object()) {
      return make_status(error_code::config_error, "category '" + name + "' must map type names to lines", name);
    }
    category_entry entry;
    entry.name = name;
    for (const auto& [type_name, lines_node] : node.items()) {
      auto lines = read_lines(lines_node, name + "." + type_name);
      if (!lines.ok()) {
        return lines.status;
      }

      auto [seen, inserted] = first_category.emplace(type_name, name);
      if (!inserted) {
        if (schema.reject_collisions) {
          log.err(
              "pattern type defined in several categories", redlog::field("type", type_name),
              redlog::field("first", seen->second), redlog::field("second", name)
          );
          return make_status(
              error_code::config_error,
              "pattern '" + type_name + "' defined in both '" + seen->second + "' and '" + name + "'", type_name
          );
        }
        log.wrn(
            "pattern type shadowed by earlier category", redlog::field("type", type_name),
            redlog::field("resolves_to", seen->second), redlog::field("shadowed", name)
        );
      }

      entry.by_type.emplace(type_name, entry.patterns.size());
      entry.patterns.push_back(pattern{name, type_name, std::move(lines.value)});
    }
    lib.categories_.push_back(std::move(entry));
    return ok_status();
  };

  for (const auto& [key, node] : root.items()) {
    if (key == "imports") {
      auto lines = read_lines(node, key);
      if (!lines.ok()) {
        return error_result<pattern_library>(lines.status);
      }
      lib.imports_ = std::move(lines.value);
      continue;
    }

    if (key == "init" || key == "init_project") {
      if (saw_init) {
        return error_result<pattern_library>(
            make_status(error_code::config_error, "library declares both 'init' and 'init_project'", key)
        );
      }
      auto lines = read_lines(node, key);
      if (!lines.ok()) {
        return error_result<pattern_library>(lines.status);
      }
      lib.init_ = std::move(lines.value);
      saw_init = true;
      continue;
    }

    if (key == "analyze" && node.is_array()) {
      auto lines = read_lines(node, key);
      if (!lines.ok()) {
        return error_result<pattern_library>(lines.status);
      }
      lib.analyze_shape_ = analyze_shape::command_list;
      lib.analyze_commands_ = std::move(lines.value);
      continue;
    }

    if (!schema.allows(key)) {
      log.err("unrecognized library category", redlog::field("backend", lib.backend_id_), redlog::field("category", key));
      return error_result<pattern_library>(
          make_status(error_code::config_error, "unrecognized library category '" + key + "'", key)
      );
    }

    auto added = add_category(key, node);
    if (!added.ok()) {
      return error_result<pattern_library>(added);
    }
    if (key == "analyze") {
      lib.analyze_shape_ = analyze_shape::pattern_map;
    }
  }

  log.dbg(
      "loaded pattern library", redlog::field("backend", lib.backend_id_),
      redlog::field("categories", lib.categories_.size()), redlog::field("patterns", lib.pattern_count())
  );
  return ok_result(std::move(lib));
}

result<pattern_library> pattern_library::load(
    std::string backend_id, const std::filesystem::path& document_path, const library_schema& schema
) {
  auto log = redlog::get_logger("f0rge.library");

  std::ifstream input(document_path);
  if (!input) {
    log.err("library document not found", redlog::field("path", document_path.string()));
    return error_result<pattern_library>(
        error_code::config_error, "library document not found: " + document_path.string()
    );
  }

  std::ostringstream buffer;
  buffer << input.rdbuf();
  return parse(std::move(backend_id), buffer.str(), schema);
}

result<pattern> pattern_library::lookup(std::string_view type_name) const {
  for (const auto& category : categories_) {
    auto it = category.by_type.find(std::string(type_name));
    if (it != category.by_type.end()) {
      return ok_result(category.patterns[it->second]);
    }
  }
  return error_result<pattern>(make_status(
      error_code::not_found, "no pattern for type '" + std::string(type_name) + "' in '" + backend_id_ + "' library",
      std::string(type_name)
  ));
}

std::vector<std::string> pattern_library::categories() const {
  std::vector<std::string> names;
  names.reserve(categories_.size());
  for (const auto& category : categories_) {
    names.push_back(category.name);
  }
  return names;
}

std::vector<pattern> pattern_library::patterns_in(std::string_view category) const {
  for (const auto& entry : categories_) {
    if (entry.name == category) {
      return entry.patterns;
    }
  }
  return {};
}

size_t pattern_library::pattern_count() const noexcept {
  size_t count = 0;
  for (const auto& category : categories_) {
    count += category.patterns.size();
  }
  return count;
}

} // namespace f0rge::library
