#include "logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

bool setup_logging(const NavConfig& cfg, LogTarget target, std::string& msg) {
  spdlog::sink_ptr sink;
  try {
    if (!cfg.log_file.empty()) {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_file);
    } else if (target == LogTarget::Stderr) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    }
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not set up logging: ") + e.what();
    return false;
  }
  // replaces any logger from an earlier call; the old one stays in place on failure
  auto logger = std::make_shared<spdlog::logger>("fnav", std::move(sink));
  logger->set_level(spdlog::level::from_str(cfg.log_level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(std::move(logger));
  return true;
}
