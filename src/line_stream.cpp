#include "line_stream.hpp"
#include <cerrno>
#include <cstring>
#include <utility>

LineStream::LineStream(std::string path, size_t chunk_size)
  : path_(std::move(path)), chunk_size_(chunk_size == 0 ? FNAV_READ_CHUNK_SIZE : chunk_size) {}

bool LineStream::open() {
  fd_ = ReadFd::open(path_);
  if (!fd_.valid()) { fail(std::string("File not found: ") + path_); return false; }
  buf_.resize(chunk_size_);
  pos_ = len_ = 0;
  state_ = State::Open;
  return true;
}

void LineStream::fail(std::string msg) {
  fd_.reset();
  buf_.clear();
  buf_.shrink_to_fit();
  partial_.clear();
  error_ = std::move(msg);
  state_ = State::Failed;
}

bool LineStream::fill() {
  ssize_t n = fd_.read_some(buf_.data(), buf_.size());
  if (n < 0) {
    fail(std::string("can not read file: ") + path_ + " (" + std::strerror(errno) + ")");
    return false;
  }
  pos_ = 0;
  len_ = static_cast<size_t>(n);
  return n > 0;
}

bool LineStream::next(std::string& out) {
  if (state_ == State::Fresh && !open()) return false;
  if (state_ != State::Open) return false;
  for (;;) {
    if (pos_ < len_) {
      const char* start = buf_.data() + pos_;
      const void* nl = std::memchr(start, '\n', len_ - pos_);
      if (nl) {
        size_t n = static_cast<size_t>(static_cast<const char*>(nl) - start);
        if (partial_.empty()) {
          out.assign(start, n);
        } else {
          partial_.append(start, n);
          out.swap(partial_);
          partial_.clear();
        }
        pos_ += n + 1;
        ++line_no_;
        return true;
      }
      partial_.append(start, len_ - pos_);
      pos_ = len_;
    }
    if (!fill()) {
      if (failed()) return false;
      // end of file: hand out a final line without trailing newline
      fd_.reset();
      state_ = State::Exhausted;
      if (partial_.empty()) return false;
      out.swap(partial_);
      partial_.clear();
      ++line_no_;
      return true;
    }
  }
}

void LineStream::close() {
  if (state_ != State::Fresh && state_ != State::Open) return;
  fd_.reset();
  partial_.clear();
  pos_ = len_ = 0;
  state_ = State::Closed;
}
