#include "navigator.hpp"
#include "state_store.hpp"
#include "test_util.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

template <class F>
static double timed(F&& f) {
  auto t0 = std::chrono::steady_clock::now();
  f();
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  long N = 100000;
  if (argc > 1) {
    try { N = std::stol(argv[1]); } catch (const std::exception&) {}
  }
  TempDir dir;
  std::string path;
  double t_write = timed([&]{ path = write_large_fixture(dir, N); });
  std::cout << "[fixture]    " << N << " lines written in " << t_write << "s\n";

  for (size_t chunk : {size_t(4096), size_t(64 * 1024), size_t(1024 * 1024)}) {
    StateStore store;
    Navigator nav(store, chunk);
    NavResult r;
    double t_first = timed([&]{ r = nav.go_to_line(path, 1); });
    double t_last = timed([&]{ r = nav.go_to_line(path, N); });
    double t_mid = timed([&]{ r = nav.go_to_line(path, N / 2); });
    double t_find = timed([&]{ r = nav.find(path, "FINDME"); });
    std::string status = r.status;
    double t_regex = timed([&]{ r = nav.find(path, "Line \\d{5}:", true); });
    double t_next = timed([&]{ r = nav.next_match(path); });
    std::cout << "[chunk " << chunk << "]\n"
              << "  go_to_line first " << t_first << "s, last " << t_last << "s, middle " << t_mid << "s\n"
              << "  find literal " << t_find << "s (" << status << ")\n"
              << "  find regex " << t_regex << "s, next_match " << t_next << "s (" << r.status << ")\n";
  }
  return 0;
}
