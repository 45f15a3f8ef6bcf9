#pragma once
/*
 * ScreenFormatter
 *
 * Purpose: turn a window of lines into the fixed textual screen layout.
 * Layout: "<num> | <content>" rows, numbers right-aligned; '~' filler rows and
 *         an end-of-file banner once the window reaches the last line.
 * Constraint: stateless.
 */
#include <string>
#include <vector>
#include "types.hpp"
#include "config.hpp"

int digit_width(long n);

std::string render_screen(const std::vector<LineEntry>& lines, long total_lines,
                          int page_size = FNAV_DEFAULT_PAGE_SIZE);

std::string eof_banner(long total_lines);
