#pragma once

#include "pattern_library.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace f0rge::library {

struct backend_descriptor {
  std::string id;
  std::string document;                   // file name inside the library directory
  std::vector<std::string> interpreter; // empty runs scripts with the configured interpreter
};

// resolves backend ids to library documents; each library is loaded once per process
class library_catalog {
public:
  explicit library_catalog(std::filesystem::path library_dir, library_schema schema = library_schema::defaults());

  static std::vector<backend_descriptor> builtin_backends();

  void register_backend(backend_descriptor backend);

  result<backend_descriptor> backend(std::string_view backend_id) const;
  result<std::shared_ptr<const pattern_library>> load(std::string_view backend_id);

  std::vector<std::string> backend_ids() const;
  const std::filesystem::path& library_dir() const noexcept { return library_dir_; }

private:
  std::filesystem::path library_dir_;
  library_schema schema_;
  std::map<std::string, backend_descriptor> backends_;
  std::map<std::string, std::shared_ptr<const pattern_library>> loaded_;
};

} // namespace f0rge::library
