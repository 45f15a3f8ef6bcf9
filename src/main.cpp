#include "ncurses_terminal.hpp"
#include "pager.hpp"
#include "batch_session.hpp"
#include "nav_config.hpp"
#include "logging.hpp"
#include "config.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>
#include <spdlog/spdlog.h>

static void usage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s [--rc <path>] [--batch] [--version] [--help] [file]\n"
               "  --batch    read tool requests from stdin, one per line\n"
               "  --rc PATH  settings file (default ~/.fnavrc)\n",
               prog);
}

int main(int argc, char** argv) {
  bool batch = false;
  std::optional<std::filesystem::path> rc;
  std::optional<std::string> file;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--batch") batch = true;
    else if (a == "--version") { std::printf("%s %s\n", FNAV_NAME, FNAV_VERSION); return 0; }
    else if (a == "--help" || a == "-h") { usage(argv[0]); return 0; }
    else if (a == "--rc") {
      if (i + 1 >= argc) { usage(argv[0]); return 2; }
      rc = std::filesystem::path(argv[++i]);
    }
    else if (!a.empty() && a[0] == '-') { std::fprintf(stderr, "unknown option: %s\n", a.c_str()); usage(argv[0]); return 2; }
    else file = a;
  }

  NavConfig cfg;
  std::vector<std::string> rc_msgs;
  if (rc) {
    std::error_code ec;
    if (!std::filesystem::exists(*rc, ec)) { std::fprintf(stderr, "rc file not found: %s\n", rc->string().c_str()); return 1; }
  } else {
    rc = default_rc_path();
  }
  bool rc_ok = !rc || load_rc(*rc, cfg, rc_msgs);

  std::string msg;
  if (!setup_logging(cfg, batch ? LogTarget::Stderr : LogTarget::FileOnly, msg)) {
    std::fprintf(stderr, "%s\n", msg.c_str());
    return 1;
  }
  for (const auto& m : rc_msgs) spdlog::warn("{}", m);
  if (!rc_ok) spdlog::warn("rc file ignored");

  if (batch) {
    spdlog::info("{} {} batch mode, pagesize={} chunksize={}", FNAV_NAME, FNAV_VERSION, cfg.page_size, cfg.chunk_size);
    BatchSession session(cfg);
    session.run(std::cin, std::cout);
    return 0;
  }

  if (!file) { usage(argv[0]); return 2; }
  if (::access(file->c_str(), R_OK) != 0) {
    std::fprintf(stderr, "File not found: %s\n", file->c_str());
    return 1;
  }
  spdlog::info("{} {} viewing {}", FNAV_NAME, FNAV_VERSION, *file);
  NcursesTerminal term;
  Pager pager(term, *file, cfg);
  if (!pager.open()) spdlog::error("{}", pager.message());
  pager.run();
  return 0;
}
