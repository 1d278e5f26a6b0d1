#include "types.hpp"

namespace f0rge {

std::string_view stage_name(stage value) noexcept {
  switch (value) {
  case stage::structure:
    return "structure";
  case stage::materials:
    return "materials";
  case stage::physics:
    return "physics";
  case stage::setup:
    return "setup";
  case stage::analyze:
    return "analyze";
  case stage::results:
    return "results";
  }
  return "unknown";
}

std::optional<stage> parse_stage(std::string_view name) {
  for (stage value : all_stages) {
    if (stage_name(value) == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::string compiled_script::text() const {
  std::string out;
  for (const auto& line : lines) {
    out += line;
    out += '\n';
  }
  return out;
}

std::string_view termination_name(termination value) noexcept {
  switch (value) {
  case termination::exited:
    return "exited";
  case termination::signaled:
    return "signaled";
  case termination::timed_out:
    return "timed_out";
  case termination::cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::string_view attempt_outcome_name(attempt_outcome value) noexcept {
  switch (value) {
  case attempt_outcome::succeeded:
    return "succeeded";
  case attempt_outcome::generation_failed:
    return "generation_failed";
  case attempt_outcome::compile_failed:
    return "compile_failed";
  case attempt_outcome::execution_failed:
    return "execution_failed";
  case attempt_outcome::timed_out:
    return "timed_out";
  case attempt_outcome::cancelled:
    return "cancelled";
  case attempt_outcome::infrastructure_failed:
    return "infrastructure_failed";
  }
  return "unknown";
}

} // namespace f0rge
