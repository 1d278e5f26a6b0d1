#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace f0rge::library {

// categories a library document is allowed to declare besides the reserved preamble keys
struct library_schema {
  std::vector<std::string> pattern_categories;
  bool reject_collisions = false;

  static library_schema defaults();

  bool allows(std::string_view category) const;
};

enum class analyze_shape { absent, command_list, pattern_map };

class pattern_library {
public:
  pattern_library() = default;

  static result<pattern_library> parse(
      std::string backend_id, std::string_view document, const library_schema& schema = library_schema::defaults()
  );
  static result<pattern_library> load(
      std::string backend_id, const std::filesystem::path& document_path,
      const library_schema& schema = library_schema::defaults()
  );

  // first category in document order that defines type_name wins
  result<pattern> lookup(std::string_view type_name) const;

  const std::string& backend_id() const noexcept { return backend_id_; }
  const std::vector<std::string>& imports() const noexcept { return imports_; }
  const std::vector<std::string>& init() const noexcept { return init_; }
  analyze_shape analyze() const noexcept { return analyze_shape_; }
  const std::vector<std::string>& analyze_commands() const noexcept { return analyze_commands_; }

  std::vector<std::string> categories() const;
  std::vector<pattern> patterns_in(std::string_view category) const;
  size_t pattern_count() const noexcept;

private:
  struct category_entry {
    std::string name;
    std::vector<pattern> patterns;
    std::unordered_map<std::string, size_t> by_type;
  };

  std::string backend_id_;
  std::vector<std::string> imports_;
  std::vector<std::string> init_;
  analyze_shape analyze_shape_ = analyze_shape::absent;
  std::vector<std::string> analyze_commands_;
  std::vector<category_entry> categories_;
};

} // namespace f0rge::library
