#pragma once
/*
 * SearchEngine
 *
 * Purpose: scan a file for a literal or regex pattern, line granularity, capped hits.
 * Design: pure w.r.t. navigator state; Navigator applies the outcome.
 * Note: both modes are case-insensitive. Patterns run on RE2, so matching time
 *       is linear in the line length and a long line cannot exhaust the stack.
 *       RE2 syntax has no backreferences or lookaround; such patterns are invalid.
 */
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <re2/re2.h>
#include "types.hpp"
#include "config.hpp"

struct SearchOutcome {
  std::vector<MatchRecord> matches;
  int landed_index = -1;
  bool capped = false;

  bool empty() const { return matches.empty(); }
};

// compiled search pattern, shared by the scan and the pager highlight
class LinePattern {
public:
  // false with msg ("Invalid regex pattern: ...") when the pattern does not compile
  bool compile(const std::string& pattern, bool is_regex, std::string& msg);
  bool matches(const std::string& line) const;
  // first hit inside text; false when there is none
  bool first_hit(const std::string& text, size_t& pos, size_t& len) const;

private:
  std::unique_ptr<re2::RE2> re_;
};

class SearchEngine {
public:
  explicit SearchEngine(size_t max_results = FNAV_MAX_SEARCH_RESULTS,
                        size_t chunk_size = FNAV_READ_CHUNK_SIZE)
    : max_results_(max_results), chunk_size_(chunk_size) {}

  enum class Status { Ok, InvalidPattern, NotFound };

  Status search(const std::string& path, const std::string& pattern, bool is_regex,
                long cursor_line, SearchOutcome& out, std::string& msg) const;

private:
  size_t max_results_;
  size_t chunk_size_;
};
