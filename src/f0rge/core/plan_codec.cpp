#include "plan_codec.hpp"
#include <redlog.hpp>

namespace f0rge {

namespace {

constexpr const char* backend_keys[] = {"backend_id", "backend", "engine"};

result<item> parse_item(const nlohmann::json& node, stage where) {
  if (!node.is_object()) {
    return error_result<item>(make_status(
        error_code::parse_error, "item in stage '" + std::string(stage_name(where)) + "' is not an object", "",
        std::string(stage_name(where))
    ));
  }

  auto type_it = node.find("type");
  if (type_it == node.end() || !type_it->is_string() || type_it->get<std::string>().empty()) {
    return error_result<item>(make_status(
        error_code::parse_error, "item in stage '" + std::string(stage_name(where)) + "' has no type", "",
        std::string(stage_name(where))
    ));
  }

  item out;
  out.type = type_it->get<std::string>();

  auto params_it = node.find("params");
  if (params_it != node.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      return error_result<item>(make_status(
          error_code::parse_error, "params of '" + out.type + "' is not an object", out.type,
          std::string(stage_name(where))
      ));
    }
    for (const auto& [key, value] : params_it->items()) {
      out.params[key] = scalar_text(value);
    }
  }
  return ok_result(std::move(out));
}

result<std::vector<item>> parse_stage_items(const nlohmann::json& node, stage where) {
  std::vector<item> items;
  if (node.is_object()) {
    auto parsed = parse_item(node, where);
    if (!parsed.ok()) {
      return error_result<std::vector<item>>(parsed.status);
    }
    items.push_back(std::move(parsed.value));
    return ok_result(std::move(items));
  }

  if (!node.is_array()) {
    return error_result<std::vector<item>>(make_status(
        error_code::parse_error, "stage '" + std::string(stage_name(where)) + "' must be an object or array", "",
        std::string(stage_name(where))
    ));
  }

  for (const auto& entry : node) {
    auto parsed = parse_item(entry, where);
    if (!parsed.ok()) {
      return error_result<std::vector<item>>(parsed.status);
    }
    items.push_back(std::move(parsed.value));
  }
  return ok_result(std::move(items));
}

bool is_backend_key(const std::string& key) {
  for (const char* candidate : backend_keys) {
    if (key == candidate) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string scalar_text(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return "";
  }
  return value.dump();
}

result<plan> parse_plan_document(const nlohmann::json& document) {
  auto log = redlog::get_logger("f0rge.plan_codec");

  if (!document.is_object()) {
    return error_result<plan>(error_code::parse_error, "plan document is not an object");
  }

  plan out;
  for (const char* key : backend_keys) {
    auto it = document.find(key);
    if (it != document.end() && it->is_string() && !it->get<std::string>().empty()) {
      out.backend_id = it->get<std::string>();
      break;
    }
  }
  if (out.backend_id.empty()) {
    return error_result<plan>(error_code::parse_error, "plan has no backend id");
  }

  auto model_it = document.find("model_name");
  if (model_it != document.end()) {
    if (!model_it->is_string()) {
      return error_result<plan>(error_code::parse_error, "model_name must be a string");
    }
    out.model_name = model_it->get<std::string>();
  }

  auto stages_it = document.find("stages");
  if (stages_it != document.end() && !stages_it->is_null()) {
    if (!stages_it->is_object()) {
      return error_result<plan>(error_code::parse_error, "stages must be an object");
    }
    for (const auto& [key, value] : stages_it->items()) {
      auto which = parse_stage(key);
      if (!which) {
        return error_result<plan>(make_status(error_code::parse_error, "unknown stage '" + key + "'", key));
      }
      auto items = parse_stage_items(value, *which);
      if (!items.ok()) {
        return error_result<plan>(items.status);
      }
      out.stages[*which] = std::move(items.value);
    }
  }

  for (const auto& [key, value] : document.items()) {
    if (key == "stages" || key == "model_name" || is_backend_key(key)) {
      continue;
    }

    if (auto which = parse_stage(key)) {
      if (out.has_stage(*which)) {
        return error_result<plan>(make_status(error_code::parse_error, "stage '" + key + "' declared twice", key));
      }
      auto items = parse_stage_items(value, *which);
      if (!items.ok()) {
        return error_result<plan>(items.status);
      }
      out.stages[*which] = std::move(items.value);
      continue;
    }

    if (value.is_primitive()) {
      out.attributes[key] = scalar_text(value);
    } else {
      log.trc("ignoring structured top-level field", redlog::field("key", key));
    }
  }

  return ok_result(std::move(out));
}

result<plan> parse_plan(std::string_view text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    return error_result<plan>(error_code::parse_error, std::string("invalid plan json: ") + e.what());
  }
  return parse_plan_document(document);
}

nlohmann::ordered_json plan_to_json(const plan& value) {
  nlohmann::ordered_json out;
  out["backend_id"] = value.backend_id;
  out["model_name"] = value.model_name;
  for (const auto& [key, text] : value.attributes) {
    out[key] = text;
  }

  nlohmann::ordered_json stages = nlohmann::ordered_json::object();
  for (stage which : all_stages) {
    auto it = value.stages.find(which);
    if (it == value.stages.end()) {
      continue;
    }
    nlohmann::ordered_json items = nlohmann::ordered_json::array();
    for (const auto& entry : it->second) {
      nlohmann::ordered_json node;
      node["type"] = entry.type;
      node["params"] = nlohmann::ordered_json::object();
      for (const auto& [param, text] : entry.params) {
        node["params"][param] = text;
      }
      items.push_back(std::move(node));
    }
    stages[std::string(stage_name(which))] = std::move(items);
  }
  out["stages"] = std::move(stages);
  return out;
}

std::string dump_plan(const plan& value, int indent) { return plan_to_json(value).dump(indent); }

} // namespace f0rge
