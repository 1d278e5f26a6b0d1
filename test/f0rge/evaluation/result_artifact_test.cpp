#include <doctest/doctest.h>

#include "f0rge/evaluation/result_artifact.hpp"
#include "test_helpers.hpp"

namespace {

using f0rge::error_code;
using f0rge::evaluation::parse_metric_value;
using f0rge::evaluation::read_last_metric;
using f0rge::evaluation::split_csv_record;
using f0rge::test_helpers::scoped_temp_dir;
using f0rge::test_helpers::write_file;

} // namespace

TEST_CASE("csv records honour quotes") {
  auto fields = split_csv_record(R"(1,"a, b","say ""hi""" , x)");
  REQUIRE(fields.size() == 4);
  CHECK(fields[1] == "a, b");
  CHECK(fields[2] == "say \"hi\"");
  CHECK(fields[3] == "x");
}

TEST_CASE("last row of the metric column is read") {
  scoped_temp_dir dir;
  write_file(dir / "run.csv", "time,volts\n0.0,12\n0.1,350.5\n0.2,1500\n\n");

  auto metric = read_last_metric(dir / "run.csv", "volts");
  REQUIRE(metric.ok());
  CHECK(metric.value == doctest::Approx(1500.0));
}

TEST_CASE("missing artifacts and columns are distinguished") {
  scoped_temp_dir dir;
  CHECK(read_last_metric(dir / "none.csv", "volts").status.code == error_code::io_error);

  write_file(dir / "run.csv", "time,amps\n0,1\n");
  auto missing = read_last_metric(dir / "run.csv", "volts");
  CHECK(missing.status.code == error_code::not_found);
  CHECK(missing.status.subject == "volts");

  write_file(dir / "header_only.csv", "volts\n");
  CHECK(read_last_metric(dir / "header_only.csv", "volts").status.code == error_code::parse_error);

  write_file(dir / "text.csv", "volts\nhigh\n");
  CHECK(read_last_metric(dir / "text.csv", "volts").status.code == error_code::parse_error);
}

TEST_CASE("metric values must parse completely as numbers") {
  CHECK(parse_metric_value(" 1e3 ").value == doctest::Approx(1000.0));
  CHECK_FALSE(parse_metric_value("12V").ok());
  CHECK_FALSE(parse_metric_value("").ok());
  CHECK_FALSE(parse_metric_value("nan").ok());
}
