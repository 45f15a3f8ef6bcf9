#pragma once
/*
 * Navigator
 *
 * Purpose: the vim-style cursor operations over a file (go_to_line, paging,
 *          find, next/prev match).
 * Dependency: state lives in an injected StateStore; file access goes through
 *             LineWindow and SearchEngine.
 * Constraint: a command mutates state only after its scans succeeded; soft
 *             outcomes (no search, no match) are Info results, not failures.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "state_store.hpp"
#include "search_engine.hpp"
#include "config.hpp"

class Navigator {
public:
  explicit Navigator(StateStore& store, size_t chunk_size = FNAV_READ_CHUNK_SIZE);

  NavResult go_to_line(const std::string& path, long line, std::optional<int> page_size = std::nullopt);
  NavResult page_up(const std::string& path);
  NavResult page_down(const std::string& path);
  NavResult find(const std::string& path, const std::string& pattern, bool is_regex = false);
  NavResult next_match(const std::string& path);
  NavResult prev_match(const std::string& path);

  StateStore& store() { return store_; }

private:
  struct Screen {
    long cursor = 1;
    long total = 0;
    std::string text;
  };

  bool count_lines(const std::string& path, long& total, std::string& msg) const;
  bool build_screen(const std::string& path, long target, long total, int page_size,
                    Screen& out, std::string& msg) const;
  NavResult step_match(const std::string& path, int delta);

  StateStore& store_;
  SearchEngine engine_;
  size_t chunk_size_;
};

long clamp_line(long line, long total_lines);
