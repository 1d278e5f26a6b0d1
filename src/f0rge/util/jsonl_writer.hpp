#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <string_view>

namespace f0rge::util {

struct jsonl_writer_config {
  bool append = true;       // keep earlier runs in the same file
  size_t flush_every = 1;   // flush after this many lines; 0 leaves flushing to close()
};

// line-oriented json writer; every line is one self-contained json document
class jsonl_writer {
public:
  jsonl_writer() = default;
  explicit jsonl_writer(const std::string& path, jsonl_writer_config config = {});
  ~jsonl_writer();

  jsonl_writer(const jsonl_writer&) = delete;
  jsonl_writer& operator=(const jsonl_writer&) = delete;

  bool open(const std::string& path);
  void close();
  bool is_open() const { return file_.is_open(); }

  bool write_line(std::string_view json);
  bool flush();

  size_t line_count() const { return line_count_; }
  size_t bytes_written() const { return bytes_written_; }

private:
  std::ofstream file_{};
  jsonl_writer_config config_{};
  size_t line_count_ = 0;
  size_t bytes_written_ = 0;
  size_t unflushed_ = 0;
};

} // namespace f0rge::util
