#pragma once
/*
 * Renderer
 *
 * Purpose: draw a formatted navigator screen plus the status/command row.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot (PagerFrame) from the Pager.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "search_engine.hpp"

enum class PagerMode { Normal, Command, Search };

struct PagerFrame {
  const std::vector<std::string>* rows = nullptr;
  std::string file;
  long cursor_line = 1;
  PagerMode mode = PagerMode::Normal;
  std::string message;
  std::string cmdline;
  const LinePattern* highlight = nullptr;
};

class Renderer {
public:
  void render(ITerminal& term, const PagerFrame& frame);
};
