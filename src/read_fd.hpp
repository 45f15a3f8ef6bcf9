#pragma once
/*
 * ReadFd
 *
 * Purpose: owning read-only file descriptor; closed on destruction or reset().
 * Note: open and read retry on EINTR; errors leave errno set.
 */
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstddef>
#include <string>

class ReadFd {
public:
  ReadFd() = default;
  ReadFd(const ReadFd&) = delete;
  ReadFd& operator=(const ReadFd&) = delete;
  ReadFd(ReadFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  ReadFd& operator=(ReadFd&& other) noexcept {
    if (this != &other) { reset(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~ReadFd() { reset(); }

  static ReadFd open(const std::string& path) {
    ReadFd f;
    do { f.fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC); } while (f.fd_ < 0 && errno == EINTR);
    return f;
  }

  // bytes read, 0 at end of file, -1 on error
  ssize_t read_some(char* buf, size_t cap) const {
    ssize_t n;
    do { n = ::read(fd_, buf, cap); } while (n < 0 && errno == EINTR);
    return n;
  }

  bool valid() const { return fd_ >= 0; }
  void reset() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }

private:
  int fd_ = -1;
};
