#include <doctest/doctest.h>

#include "f0rge/compiler/template_substitution.hpp"

namespace {

using f0rge::param_map;
using f0rge::compiler::is_placeholder_name;
using f0rge::compiler::substitute;

} // namespace

TEST_CASE("substitution replaces named placeholders literally") {
  auto out = substitute("r={radius}", param_map{{"radius", "10[mm]"}});
  CHECK(out.text == "r=10[mm]");
  CHECK(out.unbound.empty());
}

TEST_CASE("substitution does not re-scan replaced text") {
  auto out = substitute("{a}-{b}", param_map{{"a", "{b}"}, {"b", "x"}});
  CHECK(out.text == "{b}-x");
}

TEST_CASE("substitution turns doubled braces into literal braces") {
  auto out = substitute("d = {{'volts': {v}}}", param_map{{"v", "3"}});
  CHECK(out.text == "d = {'volts': 3}");
}

TEST_CASE("substitution copies braces that are not placeholders") {
  auto out = substitute("x = {1, 2} and { spaced } and {", param_map{});
  CHECK(out.text == "x = {1, 2} and { spaced } and {");
  CHECK(out.unbound.empty());
}

TEST_CASE("substitution leaves unbound placeholders and reports them") {
  auto out = substitute("{known} {missing} {other}", param_map{{"known", "k"}});
  CHECK(out.text == "k {missing} {other}");
  REQUIRE(out.unbound.size() == 2);
  CHECK(out.unbound[0] == "missing");
  CHECK(out.unbound[1] == "other");
}

TEST_CASE("placeholder names are identifiers") {
  CHECK(is_placeholder_name("radius"));
  CHECK(is_placeholder_name("_x1"));
  CHECK_FALSE(is_placeholder_name("1x"));
  CHECK_FALSE(is_placeholder_name("a b"));
  CHECK_FALSE(is_placeholder_name(""));
}

TEST_CASE("placeholders with a format spec are reported unbound") {
  auto out = substitute("r = {radius:.2f} name = {label!r}", param_map{{"radius", "10mm"}, {"label", "coil"}});
  CHECK(out.text == "r = {radius:.2f} name = {label!r}");
  REQUIRE(out.unbound.size() == 2);
  CHECK(out.unbound[0] == "radius:.2f");
  CHECK(out.unbound[1] == "label!r");

  // dict literals and slices stay plain text
  CHECK(substitute("d = {1: 2}", param_map{}).unbound.empty());
}
