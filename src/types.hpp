#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (lines, matches, per-file state, results).
 * Principle: carry simple state; transitions live in Navigator.
 */
#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

struct LineEntry {
  long line_number = 0;
  std::string content;
};

// snapshot of a matching line at search time; not re-validated later
struct MatchRecord {
  long line_number = 0;
  std::string content;
};

struct ActiveSearch {
  std::string pattern;
  bool is_regex = false;
  std::vector<MatchRecord> matches;
  int match_cursor = -1;
};

struct NavigatorState {
  long cursor_line = 1;
  int page_size = FNAV_DEFAULT_PAGE_SIZE;
  std::optional<ActiveSearch> active_search;

  bool has_matches() const { return active_search && !active_search->matches.empty(); }
};

enum class ResultKind { Screen, Info, NotFound, InvalidPattern, InvalidArgument, UnknownTool };

struct NavResult {
  ResultKind kind = ResultKind::Info;
  std::string text;
  // "Match i of n" header already included at the top of text, empty otherwise
  std::string status;

  bool ok() const { return kind == ResultKind::Screen || kind == ResultKind::Info; }

  static NavResult screen(std::string t) { return {ResultKind::Screen, std::move(t), {}}; }
  static NavResult screen(std::string status, const std::string& body) {
    std::string t = status + "\n\n" + body;
    return {ResultKind::Screen, std::move(t), std::move(status)};
  }
  static NavResult info(std::string t) { return {ResultKind::Info, std::move(t), {}}; }
  static NavResult failure(ResultKind k, std::string t) { return {k, std::move(t), {}}; }

  // the screen without the status header
  std::string body() const { return status.empty() ? text : text.substr(std::min(text.size(), status.size() + 2)); }
};

const char* result_kind_name(ResultKind k);
