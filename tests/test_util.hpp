#pragma once
/*
 * Test helpers: scratch directory removed on scope exit, fixture writers.
 */
#include <cstdlib>
#include <stdlib.h>
#include <filesystem>
#include <fstream>
#include <string>

struct TempDir {
  std::filesystem::path path;
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "fnav_test_XXXXXX").string();
    char* p = ::mkdtemp(tmpl.data());
    if (p) path = p;
  }
  ~TempDir() { std::error_code ec; if (!path.empty()) std::filesystem::remove_all(path, ec); }
  std::string file(const std::string& name) const { return (path / name).string(); }
};

inline std::string write_file(const TempDir& dir, const std::string& name, const std::string& content) {
  std::string p = dir.file(name);
  std::ofstream out(p, std::ios::binary);
  out << content;
  return p;
}

// the 100,000 line fixture: every 1000th line has FINDME, every other 100th has TEST, no trailing newline
inline std::string write_large_fixture(const TempDir& dir, long n = 100000) {
  std::string p = dir.file("large-file.txt");
  std::ofstream out(p, std::ios::binary);
  for (long i = 1; i <= n; ++i) {
    if (i % 1000 == 0) out << "Line " << i << ": This is a SPECIAL line with keyword FINDME";
    else if (i % 100 == 0) out << "Line " << i << ": This line contains the word TEST";
    else out << "Line " << i << ": This is a regular line in the file";
    if (i < n) out << '\n';
  }
  return p;
}

inline bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
