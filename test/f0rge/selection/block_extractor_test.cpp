#include <doctest/doctest.h>

#include "f0rge/selection/block_extractor.hpp"

namespace {

using f0rge::selection::extract_first_index;
using f0rge::selection::extract_structured_block;

} // namespace

TEST_CASE("extractor prefers a fenced json block") {
  auto block = extract_structured_block("noise {x}\n```json\n{\"a\": 1}\n```\ntrailing }");
  REQUIRE(block.has_value());
  CHECK(*block == "{\"a\": 1}");
}

TEST_CASE("extractor falls back to the outermost braces") {
  auto block = extract_structured_block("the plan is {\"a\": {\"b\": 2}} as requested");
  REQUIRE(block.has_value());
  CHECK(*block == "{\"a\": {\"b\": 2}}");
}

TEST_CASE("extractor finds nothing without braces") {
  CHECK_FALSE(extract_structured_block("no structure here").has_value());
  CHECK_FALSE(extract_structured_block("} backwards {").has_value());
}

TEST_CASE("first integer is taken from arbitration answers") {
  CHECK(extract_first_index("option 2 is best, then 1").value() == 2);
  CHECK(extract_first_index("0").value() == 0);
  CHECK_FALSE(extract_first_index("the second one").has_value());
}
