#pragma once

#include "result.hpp"
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace f0rge {

// plan stages in compile order
enum class stage { structure, materials, physics, setup, analyze, results };

inline constexpr std::array<stage, 6> all_stages = {stage::structure, stage::materials, stage::physics,
                                                    stage::setup,     stage::analyze,   stage::results};

std::string_view stage_name(stage value) noexcept;
std::optional<stage> parse_stage(std::string_view name);

using param_map = std::map<std::string, std::string>;

struct item {
  std::string type;
  param_map params;
};

struct plan {
  std::string backend_id;
  std::string model_name;
  param_map attributes; // other top-level scalar fields of the plan document
  std::map<stage, std::vector<item>> stages;

  bool has_stage(stage value) const { return stages.find(value) != stages.end(); }
};

struct pattern {
  std::string category;
  std::string type_name;
  std::vector<std::string> template_lines;
};

enum class compile_mode { strict, tolerant };

struct compiled_script {
  std::vector<std::string> lines;
  std::vector<std::string> warnings;

  std::string text() const;
};

enum class termination { exited, signaled, timed_out, cancelled };

std::string_view termination_name(termination value) noexcept;

struct execution_result {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  std::optional<std::string> result_artifact_path;
  termination how = termination::exited;
  int signal = 0;
  double duration_ms = 0.0;

  bool succeeded() const noexcept { return how == termination::exited && exit_code == 0; }
};

struct candidate {
  size_t index = 0;
  std::string raw_text;
  bool valid = false;
  plan parsed;
  std::string diagnostic;
};

struct outcome_score {
  std::string label;
  double reward = 0.0;
};

enum class attempt_outcome {
  succeeded,
  generation_failed,
  compile_failed,
  execution_failed,
  timed_out,
  cancelled,
  infrastructure_failed
};

std::string_view attempt_outcome_name(attempt_outcome value) noexcept;

struct repair_attempt {
  size_t index = 0;
  std::string prompt;
  std::optional<f0rge::plan> generated_plan;
  std::optional<compiled_script> script;
  std::optional<execution_result> execution;
  std::optional<outcome_score> score;
  std::optional<double> metric_value;
  attempt_outcome outcome = attempt_outcome::generation_failed;
  std::string diagnostic;
};

} // namespace f0rge
