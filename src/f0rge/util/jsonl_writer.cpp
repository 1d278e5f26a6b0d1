#include "jsonl_writer.hpp"

namespace f0rge::util {

jsonl_writer::jsonl_writer(const std::string& path, jsonl_writer_config config) : config_(config) {
  if (!path.empty()) {
    open(path);
  }
}

jsonl_writer::~jsonl_writer() { close(); }

bool jsonl_writer::open(const std::string& path) {
  close();

  auto mode = std::ios::out | std::ios::binary | (config_.append ? std::ios::app : std::ios::trunc);
  file_.open(path, mode);
  if (!file_.is_open()) {
    return false;
  }

  line_count_ = 0;
  bytes_written_ = 0;
  unflushed_ = 0;
  return true;
}

void jsonl_writer::close() {
  if (!file_.is_open()) {
    return;
  }
  file_.flush();
  file_.close();
}

bool jsonl_writer::write_line(std::string_view json) {
  if (!file_.is_open()) {
    return false;
  }

  // embedded newlines would split one record over several lines
  for (char ch : json.substr(0, json.empty() || json.back() != '\n' ? json.size() : json.size() - 1)) {
    if (ch == '\n') {
      return false;
    }
  }

  file_.write(json.data(), static_cast<std::streamsize>(json.size()));
  size_t written = json.size();
  if (json.empty() || json.back() != '\n') {
    file_.put('\n');
    written += 1;
  }
  if (!file_) {
    return false;
  }

  line_count_ += 1;
  bytes_written_ += written;
  unflushed_ += 1;

  if (config_.flush_every > 0 && unflushed_ >= config_.flush_every) {
    return flush();
  }
  return true;
}

bool jsonl_writer::flush() {
  if (!file_.is_open()) {
    return false;
  }
  file_.flush();
  unflushed_ = 0;
  return static_cast<bool>(file_);
}

} // namespace f0rge::util
