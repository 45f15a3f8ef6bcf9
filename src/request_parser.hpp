#pragma once
/*
 * RequestParser
 *
 * Purpose: split one batch request line "<tool> key=value ..." into a tool name
 *          and its arguments.
 * Quoting: values may be double-quoted; inside quotes \" and \\ are escapes.
 */
#include <string>
#include "tool_registry.hpp"

struct Request {
  std::string tool;
  ToolArgs args;
};

// false with msg on malformed input (unterminated quote, missing '=', duplicate key)
bool parse_request(const std::string& line, Request& out, std::string& msg);

// true for blank lines and '#' comments
bool is_skippable_request(const std::string& line);
