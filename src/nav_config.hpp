#pragma once
/*
 * NavConfig
 *
 * Purpose: runtime settings read from an rc file (~/.fnavrc or --rc <path>).
 * Format: one ":set <name> <value>" per line; '#', '"' and '//' start comments.
 * Usage: load_rc(path, cfg, messages); bad lines are reported and skipped.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

struct NavConfig {
  int page_size = FNAV_DEFAULT_PAGE_SIZE;
  size_t chunk_size = FNAV_READ_CHUNK_SIZE;
  std::string log_level = "info";
  std::string log_file;
};

// applies a single rc line; false with msg if it is not understood
bool apply_rc_line(const std::string& line, NavConfig& cfg, std::string& msg);

// a missing file is not an error; returns false only if an existing file can't be read
bool load_rc(const std::filesystem::path& path, NavConfig& cfg, std::vector<std::string>& messages);

std::optional<std::filesystem::path> default_rc_path();
