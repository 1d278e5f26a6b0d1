#pragma once

#include "util/jsonl_writer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace f0rge::loop {

struct trajectory {
  std::string prompt;
  std::string transcript; // diagnostic for failed attempts, process output otherwise
  double reward = 0.0;
  std::string label;
  std::string outcome;
  size_t attempt = 0;
};

// logging collaborator; records are fire-and-forget and failures never reach the loop
class trajectory_sink {
public:
  virtual ~trajectory_sink() = default;

  virtual void record(const trajectory& entry) = 0;
};

class jsonl_trajectory_sink : public trajectory_sink {
public:
  explicit jsonl_trajectory_sink(const std::string& path);

  void record(const trajectory& entry) override;

  bool is_open() const { return writer_.is_open(); }

private:
  std::string path_;
  util::jsonl_writer writer_;
};

// writes each trajectory as a structured log line
class log_trajectory_sink : public trajectory_sink {
public:
  void record(const trajectory& entry) override;
};

// forwards to several sinks in order
class fanout_trajectory_sink : public trajectory_sink {
public:
  void add(std::shared_ptr<trajectory_sink> sink);
  void record(const trajectory& entry) override;

private:
  std::vector<std::shared_ptr<trajectory_sink>> sinks_;
};

} // namespace f0rge::loop
