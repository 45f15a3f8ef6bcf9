#pragma once
/*
 * LineStream
 *
 * Purpose: lazy forward pass over a file, one line at a time, bounded memory.
 * Usage: LineStream s(path); std::string line; while (s.next(line)) {...}
 *        then check s.failed()/s.error().
 * Note: the file is opened on the first next(); the descriptor is released on
 *       exhaustion, failure, close() or destruction. Lines split on '\n' only,
 *       bytes are kept verbatim.
 */
#include <cstddef>
#include <string>
#include <vector>
#include "read_fd.hpp"
#include "config.hpp"

class LineStream {
public:
  enum class State { Fresh, Open, Exhausted, Failed, Closed };

  explicit LineStream(std::string path, size_t chunk_size = FNAV_READ_CHUNK_SIZE);
  LineStream(const LineStream&) = delete;
  LineStream& operator=(const LineStream&) = delete;
  LineStream(LineStream&&) noexcept = default;
  LineStream& operator=(LineStream&&) noexcept = default;

  bool next(std::string& out);
  void close();

  State state() const { return state_; }
  bool failed() const { return state_ == State::Failed; }
  const std::string& error() const { return error_; }
  // 1-based number of the last line handed out, 0 before the first
  long line_number() const { return line_no_; }

private:
  bool open();
  bool fill();
  void fail(std::string msg);

  std::string path_;
  size_t chunk_size_;
  ReadFd fd_;
  std::vector<char> buf_;
  size_t pos_ = 0;
  size_t len_ = 0;
  std::string partial_;
  long line_no_ = 0;
  State state_ = State::Fresh;
  std::string error_;
};
