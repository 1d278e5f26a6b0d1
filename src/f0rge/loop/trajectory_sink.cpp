#include "trajectory_sink.hpp"
#include <nlohmann/json.hpp>
#include <redlog.hpp>

namespace f0rge::loop {

jsonl_trajectory_sink::jsonl_trajectory_sink(const std::string& path) : path_(path), writer_(path) {
  if (!writer_.is_open()) {
    auto log = redlog::get_logger("f0rge.trajectory");
    log.wrn("cannot open trajectory log, records will be dropped", redlog::field("path", path_));
  }
}

void jsonl_trajectory_sink::record(const trajectory& entry) {
  nlohmann::ordered_json line;
  line["attempt"] = entry.attempt;
  line["prompt"] = entry.prompt;
  line["transcript"] = entry.transcript;
  line["reward"] = entry.reward;
  line["label"] = entry.label;
  line["outcome"] = entry.outcome;

  // replace invalid utf-8 from process output instead of throwing
  std::string text = line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  if (!writer_.write_line(text)) {
    auto log = redlog::get_logger("f0rge.trajectory");
    log.wrn("trajectory record dropped", redlog::field("path", path_), redlog::field("attempt", entry.attempt));
  }
}

void log_trajectory_sink::record(const trajectory& entry) {
  auto log = redlog::get_logger("f0rge.trajectory");
  log.inf(
      "trajectory", redlog::field("attempt", entry.attempt), redlog::field("outcome", entry.outcome),
      redlog::field("label", entry.label), redlog::field("reward", entry.reward)
  );
  log.trc("trajectory transcript", redlog::field("transcript", entry.transcript));
}

void fanout_trajectory_sink::add(std::shared_ptr<trajectory_sink> sink) {
  if (sink) {
    sinks_.push_back(std::move(sink));
  }
}

void fanout_trajectory_sink::record(const trajectory& entry) {
  for (const auto& sink : sinks_) {
    sink->record(entry);
  }
}

} // namespace f0rge::loop
