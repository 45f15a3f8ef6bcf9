#include "line_window.hpp"
#include "line_stream.hpp"

bool get_window(const std::string& path, long start_line, long count,
                std::vector<LineEntry>& out, std::string& msg, size_t chunk_size) {
  out.clear();
  LineStream s(path, chunk_size);
  const long end_line = start_line + count;
  std::string line;
  while (s.next(line)) {
    long n = s.line_number();
    if (n >= end_line) break;
    if (n >= start_line) out.push_back({n, std::move(line)});
  }
  if (s.failed()) { out.clear(); msg = s.error(); return false; }
  return true;
}

bool get_total_lines(const std::string& path, long& total, std::string& msg, size_t chunk_size) {
  total = 0;
  LineStream s(path, chunk_size);
  std::string line;
  while (s.next(line)) ++total;
  if (s.failed()) { total = 0; msg = s.error(); return false; }
  return true;
}
