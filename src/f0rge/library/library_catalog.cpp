#include "library_catalog.hpp"
#include "util/string_utils.hpp"
#include <redlog.hpp>

namespace f0rge::library {

library_catalog::library_catalog(std::filesystem::path library_dir, library_schema schema)
    : library_dir_(std::move(library_dir)), schema_(std::move(schema)) {
  for (auto& backend : builtin_backends()) {
    register_backend(std::move(backend));
  }
}

std::vector<backend_descriptor> library_catalog::builtin_backends() {
  return {
      backend_descriptor{"comsol", "comsol.json", {}},
      backend_descriptor{"ansys", "ansys.json", {}},
      backend_descriptor{"ads", "ads.json", {}},
  };
}

void library_catalog::register_backend(backend_descriptor backend) {
  backend.id = util::to_lower(backend.id);
  loaded_.erase(backend.id);
  std::string key = backend.id;
  backends_[key] = std::move(backend);
}

result<backend_descriptor> library_catalog::backend(std::string_view backend_id) const {
  auto it = backends_.find(util::to_lower(backend_id));
  if (it == backends_.end()) {
    return error_result<backend_descriptor>(make_status(
        error_code::config_error, "unsupported backend '" + std::string(backend_id) + "'", std::string(backend_id)
    ));
  }
  return ok_result(it->second);
}

result<std::shared_ptr<const pattern_library>> library_catalog::load(std::string_view backend_id) {
  auto log = redlog::get_logger("f0rge.library");
  using lib_ptr = std::shared_ptr<const pattern_library>;

  auto descriptor = backend(backend_id);
  if (!descriptor.ok()) {
    log.err("unknown backend requested", redlog::field("backend", std::string(backend_id)));
    return error_result<lib_ptr>(descriptor.status);
  }

  auto cached = loaded_.find(descriptor.value.id);
  if (cached != loaded_.end()) {
    return ok_result(cached->second);
  }

  auto path = library_dir_ / descriptor.value.document;
  log.inf("loading pattern library", redlog::field("backend", descriptor.value.id), redlog::field("path", path.string()));
  auto loaded = pattern_library::load(descriptor.value.id, path, schema_);
  if (!loaded.ok()) {
    return error_result<lib_ptr>(loaded.status);
  }

  auto shared = std::make_shared<const pattern_library>(std::move(loaded.value));
  loaded_.emplace(descriptor.value.id, shared);
  return ok_result(lib_ptr(shared));
}

std::vector<std::string> library_catalog::backend_ids() const {
  std::vector<std::string> ids;
  ids.reserve(backends_.size());
  for (const auto& [id, backend] : backends_) {
    ids.push_back(id);
  }
  return ids;
}

} // namespace f0rge::library
