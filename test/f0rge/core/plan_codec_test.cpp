#include <doctest/doctest.h>

#include "f0rge/core/plan_codec.hpp"

namespace {

using f0rge::error_code;
using f0rge::parse_plan;
using f0rge::stage;

} // namespace

TEST_CASE("plan codec reads top-level stages and attributes") {
  auto parsed = parse_plan(R"({
    "engine": "ansys",
    "project_name": "SaturationTest",
    "design_name": "MaxwellDesign1",
    "structure": [{"type": "box", "params": {"dx": "10", "name": "Core"}}],
    "setup": {"type": "transient", "params": {"stop_time": "10ms"}},
    "analyze": [{"type": "run"}]
  })");
  REQUIRE(parsed.ok());

  const auto& plan = parsed.value;
  CHECK(plan.backend_id == "ansys");
  CHECK(plan.attributes.at("project_name") == "SaturationTest");
  CHECK(plan.attributes.at("design_name") == "MaxwellDesign1");
  REQUIRE(plan.has_stage(stage::structure));
  CHECK(plan.stages.at(stage::structure).front().params.at("name") == "Core");
  REQUIRE(plan.stages.at(stage::setup).size() == 1);
  CHECK(plan.stages.at(stage::setup).front().type == "transient");
  CHECK(plan.stages.at(stage::analyze).front().params.empty());
  CHECK_FALSE(plan.has_stage(stage::materials));
}

TEST_CASE("plan codec reads stages nested under stages") {
  auto parsed = parse_plan(R"({"backend_id": "comsol", "model_name": "M",
    "stages": {"physics": [{"type": "magnetic_fields_mf"}], "results": []}})");
  REQUIRE(parsed.ok());
  CHECK(parsed.value.model_name == "M");
  CHECK(parsed.value.stages.at(stage::physics).front().type == "magnetic_fields_mf");
  CHECK(parsed.value.has_stage(stage::results));
  CHECK(parsed.value.stages.at(stage::results).empty());
}

TEST_CASE("plan codec keeps string params verbatim and dumps other values") {
  auto parsed = parse_plan(R"({"backend_id": "comsol",
    "structure": [{"type": "cylinder", "params": {"radius": "10[mm]", "turns": 40, "scale": 1.5, "on": true}}]})");
  REQUIRE(parsed.ok());
  const auto& params = parsed.value.stages.at(stage::structure).front().params;
  CHECK(params.at("radius") == "10[mm]");
  CHECK(params.at("turns") == "40");
  CHECK(params.at("scale") == "1.5");
  CHECK(params.at("on") == "true");
}

TEST_CASE("plan codec rejects malformed plans") {
  SUBCASE("not json") { CHECK(parse_plan("{nope").status.code == error_code::parse_error); }
  SUBCASE("no backend") { CHECK(parse_plan(R"({"model_name": "x"})").status.code == error_code::parse_error); }
  SUBCASE("non-object item") {
    CHECK(parse_plan(R"({"engine": "comsol", "structure": ["cylinder"]})").status.code == error_code::parse_error);
  }
  SUBCASE("item without type") {
    auto parsed = parse_plan(R"({"engine": "comsol", "materials": [{"params": {}}]})");
    CHECK(parsed.status.code == error_code::parse_error);
    CHECK(parsed.status.section == "materials");
  }
  SUBCASE("unknown nested stage") {
    auto parsed = parse_plan(R"({"engine": "comsol", "stages": {"meshing": []}})");
    CHECK(parsed.status.code == error_code::parse_error);
    CHECK(parsed.status.subject == "meshing");
  }
  SUBCASE("stage declared twice") {
    auto parsed = parse_plan(R"({"engine": "comsol", "stages": {"setup": []}, "setup": []})");
    CHECK(parsed.status.code == error_code::parse_error);
  }
}

TEST_CASE("plan codec dumps stages in compile order") {
  auto parsed = parse_plan(R"({"engine": "comsol", "results": [{"type": "export_csv"}],
    "structure": [{"type": "cylinder"}]})");
  REQUIRE(parsed.ok());

  auto text = f0rge::dump_plan(parsed.value);
  CHECK(text.find("\"structure\"") < text.find("\"results\""));

  auto again = parse_plan(text);
  REQUIRE(again.ok());
  CHECK(again.value.backend_id == "comsol");
  CHECK(again.value.stages.size() == 2);
}
