#pragma once
/*
 * Logging
 *
 * Purpose: configure the process-wide spdlog logger for the front ends.
 * Note: the navigation core never logs; batch mode logs to stderr, the pager
 *       only to a configured log file so the screen stays intact.
 */
#include <string>
#include "nav_config.hpp"

enum class LogTarget { Stderr, FileOnly };

bool setup_logging(const NavConfig& cfg, LogTarget target, std::string& msg);
