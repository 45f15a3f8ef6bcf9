#pragma once
/*
 * BatchSession
 *
 * Purpose: line-oriented request/response loop over streams (stdin/stdout).
 * Framing: each response is "<ok|err> <kind> <bytes>\n" + payload + "\n".
 * Note: owns the session's StateStore; states live as long as the session.
 */
#include <istream>
#include <ostream>
#include <string>
#include "nav_config.hpp"
#include "state_store.hpp"
#include "navigator.hpp"
#include "tool_registry.hpp"

class BatchSession {
public:
  explicit BatchSession(const NavConfig& cfg);
  BatchSession(const BatchSession&) = delete;
  BatchSession& operator=(const BatchSession&) = delete;

  // runs until EOF or "quit"; returns the number of failed requests
  int run(std::istream& in, std::ostream& out);
  NavResult handle_line(const std::string& line);

  StateStore& store() { return store_; }

private:
  StateStore store_;
  Navigator nav_;
  ToolRegistry registry_;
};

void write_response(std::ostream& out, const NavResult& r);
