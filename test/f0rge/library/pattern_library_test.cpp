#include <doctest/doctest.h>

#include "f0rge/library/pattern_library.hpp"
#include "test_helpers.hpp"

namespace {

using f0rge::error_code;
using f0rge::library::analyze_shape;
using f0rge::library::library_schema;
using f0rge::library::pattern_library;
using f0rge::test_helpers::sample_library_json;

} // namespace

TEST_CASE("pattern library loads categories in document order") {
  auto lib = pattern_library::parse("comsol", sample_library_json());
  REQUIRE(lib.ok());

  auto categories = lib.value.categories();
  REQUIRE(categories.size() == 5);
  CHECK(categories[0] == "geometry_shapes");
  CHECK(categories[4] == "results");
  CHECK(lib.value.imports().front() == "import mph");
  CHECK(lib.value.init().size() == 1);
  CHECK(lib.value.analyze() == analyze_shape::command_list);
  CHECK(lib.value.analyze_commands().front() == "model.solve()");
  CHECK(lib.value.pattern_count() == 5);
}

TEST_CASE("pattern library lookup reports the owning category") {
  auto lib = pattern_library::parse("comsol", sample_library_json());
  REQUIRE(lib.ok());

  auto found = lib.value.lookup("cylinder");
  REQUIRE(found.ok());
  CHECK(found.value.category == "geometry_shapes");
  CHECK(found.value.template_lines.size() == 2);

  auto missing = lib.value.lookup("sphere");
  CHECK(missing.status.code == error_code::not_found);
  CHECK(missing.status.subject == "sphere");
}

TEST_CASE("pattern library resolves collisions first-found") {
  auto doc = R"({
    "components": {"coil": ["first()"]},
    "structure": {"coil": ["second()"]}
  })";

  auto lib = pattern_library::parse("ads", doc);
  REQUIRE(lib.ok());
  auto found = lib.value.lookup("coil");
  REQUIRE(found.ok());
  CHECK(found.value.category == "components");
  CHECK(found.value.template_lines.front() == "first()");

  auto schema = library_schema::defaults();
  schema.reject_collisions = true;
  auto strict = pattern_library::parse("ads", doc, schema);
  CHECK(strict.status.code == error_code::config_error);
  CHECK(strict.status.subject == "coil");
}

TEST_CASE("pattern library accepts init_project and pattern-map analyze") {
  auto lib = pattern_library::parse("ansys", R"({
    "init_project": ["m3d = Maxwell3d(projectname='{project_name}')"],
    "analyze": {"run": ["m3d.analyze_setup('TransientSetup')"]}
  })");
  REQUIRE(lib.ok());
  CHECK(lib.value.init().size() == 1);
  CHECK(lib.value.analyze() == analyze_shape::pattern_map);
  CHECK(lib.value.lookup("run").value.category == "analyze");
}

TEST_CASE("pattern library rejects malformed documents") {
  SUBCASE("not json") { CHECK(pattern_library::parse("x", "{").status.code == error_code::config_error); }
  SUBCASE("unknown category") {
    auto lib = pattern_library::parse("x", R"({"widgets": {"a": ["b"]}})");
    CHECK(lib.status.code == error_code::config_error);
    CHECK(lib.status.subject == "widgets");
  }
  SUBCASE("template is not a list of strings") {
    CHECK(pattern_library::parse("x", R"({"materials": {"a": "b"}})").status.code == error_code::config_error);
    CHECK(pattern_library::parse("x", R"({"materials": {"a": [1]}})").status.code == error_code::config_error);
  }
  SUBCASE("both init keys") {
    CHECK(pattern_library::parse("x", R"({"init": [], "init_project": []})").status.code == error_code::config_error);
  }
}

TEST_CASE("pattern library schema can be extended") {
  auto schema = library_schema::defaults();
  schema.pattern_categories.push_back("widgets");
  auto lib = pattern_library::parse("x", R"({"widgets": {"a": ["b"]}})", schema);
  REQUIRE(lib.ok());
  CHECK(lib.value.lookup("a").ok());
}

TEST_CASE("pattern library load reports missing documents") {
  auto lib = pattern_library::load("x", "/nonexistent/f0rge/library.json");
  CHECK(lib.status.code == error_code::config_error);
}
