#include <doctest/doctest.h>

#include "f0rge/compiler/plan_compiler.hpp"
#include "f0rge/core/plan_codec.hpp"
#include "f0rge/library/library_catalog.hpp"
#include "test_helpers.hpp"

#include <algorithm>

namespace {

using f0rge::compile_mode;
using f0rge::error_code;
using f0rge::parse_plan;
using f0rge::compiler::compile_plan;
using f0rge::library::pattern_library;
using f0rge::test_helpers::sample_library_json;
using f0rge::test_helpers::sample_plan_json;
using f0rge::test_helpers::source_dir;

pattern_library sample_library() { return pattern_library::parse("comsol", sample_library_json()).value; }

size_t index_of(const std::vector<std::string>& lines, const std::string& line) {
  return static_cast<size_t>(std::find(lines.begin(), lines.end(), line) - lines.begin());
}

bool has_line(const std::vector<std::string>& lines, const std::string& line) {
  return index_of(lines, line) < lines.size();
}

} // namespace

TEST_CASE("compiler emits comment, substituted lines and spacing per item") {
  auto lib = sample_library();
  auto plan = parse_plan(sample_plan_json());
  REQUIRE(plan.ok());

  auto script = compile_plan(lib, plan.value, compile_mode::strict);
  REQUIRE(script.ok());
  const auto& lines = script.value.lines;

  size_t comment = index_of(lines, "# geometry_shapes: cylinder (ID: 1)");
  REQUIRE(comment < lines.size());
  CHECK(lines[comment + 1] == "cyl = geom.create('cyl1', 'Cylinder')");
  CHECK(lines[comment + 2] == "cyl.property('r', '10[mm]')");
  CHECK(lines[comment + 3].empty());

  CHECK(has_line(lines, "# == structure =="));
  CHECK(has_line(lines, "model = client.create('Coil')"));
  CHECK(has_line(lines, "# setup: frequency_domain"));
  CHECK(has_line(lines, "freq.property('plist', 'range(10, 1000, 10)')"));
  CHECK(script.value.warnings.empty());
}

TEST_CASE("cylinder block with id comment and trailing blank line") {
  auto lib = pattern_library::parse(
      "bench", R"({"geometry_shapes": {"cylinder": ["cyl = create_shape()", "cyl.set_radius({radius})"]}})"
  );
  REQUIRE(lib.ok());
  auto plan = parse_plan(R"({"backend_id": "bench",
    "structure": [{"type": "cylinder", "params": {"radius": "10mm", "height": "20mm", "id": "1"}}]})");
  REQUIRE(plan.ok());

  auto script = compile_plan(lib.value, plan.value, compile_mode::strict);
  REQUIRE(script.ok());
  const auto& lines = script.value.lines;

  size_t comment = index_of(lines, "# geometry_shapes: cylinder (ID: 1)");
  REQUIRE(comment + 3 < lines.size());
  CHECK(lines[comment + 1] == "cyl = create_shape()");
  CHECK(lines[comment + 2] == "cyl.set_radius(10mm)");
  CHECK(lines[comment + 3].empty());
}

TEST_CASE("strict compile rejects format-spec placeholders") {
  auto lib = pattern_library::parse("bench", R"({"geometry_shapes": {"cylinder": ["cyl.set_radius({radius:.2f})"]}})");
  REQUIRE(lib.ok());
  auto plan = parse_plan(R"({"backend_id": "bench", "structure": [{"type": "cylinder", "params": {"radius": "10"}}]})");
  REQUIRE(plan.ok());

  auto strict = compile_plan(lib.value, plan.value, compile_mode::strict);
  CHECK(strict.status.code == error_code::unbound_placeholder);
  CHECK(strict.status.subject == "radius:.2f");

  auto tolerant = compile_plan(lib.value, plan.value, compile_mode::tolerant);
  REQUIRE(tolerant.ok());
  CHECK(has_line(tolerant.value.lines, "cyl.set_radius({radius:.2f})"));
}

TEST_CASE("compiler orders sections independently of the plan") {
  auto lib = sample_library();
  auto plan = parse_plan(R"({"engine": "comsol", "model_name": "M",
    "results": [{"type": "export_csv", "params": {"filepath": "out.csv"}}],
    "physics": [{"type": "magnetic_fields_mf"}],
    "materials": [{"type": "copper"}],
    "structure": [{"type": "cylinder", "params": {"radius": "1", "id": "2"}}]})");
  REQUIRE(plan.ok());

  auto script = compile_plan(lib, plan.value, compile_mode::strict);
  REQUIRE(script.ok());
  const auto& lines = script.value.lines;

  size_t imports = index_of(lines, "import mph");
  size_t init = index_of(lines, "model = client.create('M')");
  size_t structure = index_of(lines, "# == structure ==");
  size_t materials = index_of(lines, "# == materials ==");
  size_t physics = index_of(lines, "# == physics ==");
  size_t analyze = index_of(lines, "model.solve()");
  size_t results = index_of(lines, "# == results ==");
  CHECK(imports < init);
  CHECK(init < structure);
  CHECK(structure < materials);
  CHECK(materials < physics);
  CHECK(physics < analyze);
  CHECK(analyze < results);
  CHECK(results < lines.size());
}

TEST_CASE("compiler output is deterministic") {
  auto lib = sample_library();
  auto plan = parse_plan(sample_plan_json());
  REQUIRE(plan.ok());

  auto first = compile_plan(lib, plan.value, compile_mode::strict);
  auto second = compile_plan(lib, plan.value, compile_mode::strict);
  REQUIRE(first.ok());
  REQUIRE(second.ok());
  CHECK(first.value.text() == second.value.text());
}

TEST_CASE("strict compile fails on unknown types") {
  auto lib = sample_library();
  auto plan = parse_plan(R"({"engine": "comsol", "physics": [{"type": "plasma_pl"}]})");
  REQUIRE(plan.ok());

  auto script = compile_plan(lib, plan.value, compile_mode::strict);
  CHECK(script.status.code == error_code::missing_pattern);
  CHECK(script.status.subject == "plasma_pl");
  CHECK(script.status.section == "physics");
}

TEST_CASE("tolerant compile skips unknown types with a warning comment") {
  auto lib = sample_library();
  auto plan = parse_plan(R"({"engine": "comsol",
    "physics": [{"type": "plasma_pl"}, {"type": "magnetic_fields_mf"}]})");
  REQUIRE(plan.ok());

  auto script = compile_plan(lib, plan.value, compile_mode::tolerant);
  REQUIRE(script.ok());
  CHECK(has_line(script.value.lines, "# WARNING: no pattern for type 'plasma_pl' in section 'physics', skipped"));
  CHECK(has_line(script.value.lines, "phys = model.physics.create('mf', 'MagneticFields', 'geom1')"));
  CHECK(script.value.warnings.size() == 1);
}

TEST_CASE("unbound placeholders fail strict and survive tolerant") {
  auto lib = sample_library();
  auto plan = parse_plan(R"({"engine": "comsol", "structure": [{"type": "cylinder", "params": {"id": "1"}}]})");
  REQUIRE(plan.ok());

  auto strict = compile_plan(lib, plan.value, compile_mode::strict);
  CHECK(strict.status.code == error_code::unbound_placeholder);
  CHECK(strict.status.subject == "radius");

  auto tolerant = compile_plan(lib, plan.value, compile_mode::tolerant);
  REQUIRE(tolerant.ok());
  CHECK(has_line(tolerant.value.lines, "cyl.property('r', '{radius}')"));
  CHECK_FALSE(tolerant.value.warnings.empty());
}

TEST_CASE("compiler rejects a plan for another backend") {
  auto lib = sample_library();
  auto plan = parse_plan(sample_plan_json("ansys"));
  REQUIRE(plan.ok());
  CHECK(compile_plan(lib, plan.value, compile_mode::strict).status.code == error_code::invalid_argument);
}

TEST_CASE("fixed analyze list ignores plan analyze items with a warning") {
  auto lib = sample_library();
  auto plan = parse_plan(R"({"engine": "comsol", "analyze": [{"type": "anything"}]})");
  REQUIRE(plan.ok());

  auto script = compile_plan(lib, plan.value, compile_mode::strict);
  REQUIRE(script.ok());
  CHECK(has_line(script.value.lines, "model.solve()"));
  CHECK(script.value.warnings.size() == 1);
}

TEST_CASE("ansys plan compiles against the shipped library") {
  f0rge::library::library_catalog catalog(source_dir() / "library");
  auto lib = catalog.load("ansys");
  REQUIRE(lib.ok());

  auto plan = parse_plan(R"({
    "engine": "ansys", "project_name": "SaturationTest", "design_name": "MaxwellDesign1",
    "structure": [{"type": "box", "params": {"px": "0", "py": "0", "pz": "0", "dx": "10", "dy": "10", "dz": "10",
                                             "name": "Core", "material": "iron"}}],
    "setup": {"type": "transient", "params": {"stop_time": "10ms", "time_step": "0.1ms"}},
    "analyze": [{"type": "run"}]})");
  REQUIRE(plan.ok());

  auto script = compile_plan(*lib.value, plan.value, compile_mode::strict);
  REQUIRE(script.ok());
  auto text = script.value.text();
  CHECK(text.find("from pyaedt import Maxwell3d") != std::string::npos);
  CHECK(text.find("m3d = Maxwell3d(projectname='SaturationTest', designname='MaxwellDesign1'") != std::string::npos);
  CHECK(text.find("m3d.modeler.create_box(position=['0', '0', '0']") != std::string::npos);
  CHECK(text.find("setup.props['StopTime'] = '10ms'") != std::string::npos);
  CHECK(text.find("m3d.analyze_setup('TransientSetup')") != std::string::npos);
}
