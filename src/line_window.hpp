#pragma once
/*
 * LineWindow
 *
 * Purpose: materialize a slice of lines or count lines with one LineStream pass.
 * Usage: get_window(path, start, count, out, msg); returns false with msg on failure.
 * Note: nothing is cached; every call reads the file fresh.
 */
#include <string>
#include <vector>
#include "types.hpp"
#include "config.hpp"

bool get_window(const std::string& path, long start_line, long count,
                std::vector<LineEntry>& out, std::string& msg,
                size_t chunk_size = FNAV_READ_CHUNK_SIZE);

bool get_total_lines(const std::string& path, long& total, std::string& msg,
                     size_t chunk_size = FNAV_READ_CHUNK_SIZE);
