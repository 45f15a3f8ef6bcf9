#include "navigator.hpp"
#include "line_window.hpp"
#include "screen_formatter.hpp"
#include <algorithm>

static const char* kNoActiveSearch = "No active search. Use 'find' first.";

long clamp_line(long line, long total_lines) {
  return std::max(1L, std::min(line, std::max(1L, total_lines)));
}

Navigator::Navigator(StateStore& store, size_t chunk_size)
  : store_(store), engine_(FNAV_MAX_SEARCH_RESULTS, chunk_size), chunk_size_(chunk_size) {}

bool Navigator::count_lines(const std::string& path, long& total, std::string& msg) const {
  return get_total_lines(path, total, msg, chunk_size_);
}

bool Navigator::build_screen(const std::string& path, long target, long total, int page_size,
                             Screen& out, std::string& msg) const {
  out.cursor = clamp_line(target, total);
  out.total = total;
  std::vector<LineEntry> lines;
  if (!get_window(path, out.cursor, page_size, lines, msg, chunk_size_)) return false;
  out.text = render_screen(lines, total, page_size);
  return true;
}

NavResult Navigator::go_to_line(const std::string& path, long line, std::optional<int> page_size) {
  NavigatorState& st = store_.get_or_create(path);
  const int ps = (page_size && *page_size >= 1) ? *page_size : st.page_size;
  long total = 0;
  std::string msg;
  Screen scr;
  if (!count_lines(path, total, msg)) return NavResult::failure(ResultKind::NotFound, msg);
  if (!build_screen(path, line, total, ps, scr, msg)) return NavResult::failure(ResultKind::NotFound, msg);
  st.page_size = ps;
  st.cursor_line = scr.cursor;
  return NavResult::screen(std::move(scr.text));
}

NavResult Navigator::page_up(const std::string& path) {
  NavigatorState& st = store_.get_or_create(path);
  long total = 0;
  std::string msg;
  Screen scr;
  if (!count_lines(path, total, msg)) return NavResult::failure(ResultKind::NotFound, msg);
  if (!build_screen(path, st.cursor_line - st.page_size, total, st.page_size, scr, msg))
    return NavResult::failure(ResultKind::NotFound, msg);
  st.cursor_line = scr.cursor;
  return NavResult::screen(std::move(scr.text));
}

NavResult Navigator::page_down(const std::string& path) {
  NavigatorState& st = store_.get_or_create(path);
  long total = 0;
  std::string msg;
  Screen scr;
  // total is counted once and shared by the clamp and the banner
  if (!count_lines(path, total, msg)) return NavResult::failure(ResultKind::NotFound, msg);
  if (!build_screen(path, st.cursor_line + st.page_size, total, st.page_size, scr, msg))
    return NavResult::failure(ResultKind::NotFound, msg);
  st.cursor_line = scr.cursor;
  return NavResult::screen(std::move(scr.text));
}

NavResult Navigator::find(const std::string& path, const std::string& pattern, bool is_regex) {
  NavigatorState& st = store_.get_or_create(path);
  SearchOutcome found;
  std::string msg;
  switch (engine_.search(path, pattern, is_regex, st.cursor_line, found, msg)) {
    case SearchEngine::Status::InvalidPattern: return NavResult::failure(ResultKind::InvalidPattern, msg);
    case SearchEngine::Status::NotFound: return NavResult::failure(ResultKind::NotFound, msg);
    case SearchEngine::Status::Ok: break;
  }

  ActiveSearch next;
  next.pattern = pattern;
  next.is_regex = is_regex;
  next.match_cursor = found.landed_index;
  if (found.empty()) {
    st.active_search = std::move(next);
    return NavResult::info("Pattern not found: \"" + pattern + "\"");
  }

  long total = 0;
  Screen scr;
  const long target = found.matches[static_cast<size_t>(found.landed_index)].line_number;
  if (!count_lines(path, total, msg)) return NavResult::failure(ResultKind::NotFound, msg);
  if (!build_screen(path, target, total, st.page_size, scr, msg)) return NavResult::failure(ResultKind::NotFound, msg);

  next.matches = std::move(found.matches);
  const size_t n = next.matches.size();
  st.active_search = std::move(next);
  st.cursor_line = scr.cursor;
  // the header always counts the landed match as the first one; next_match continues from it
  return NavResult::screen("Found match 1 of " + std::to_string(n), scr.text);
}

NavResult Navigator::step_match(const std::string& path, int delta) {
  NavigatorState& st = store_.get_or_create(path);
  if (!st.has_matches()) return NavResult::info(kNoActiveSearch);

  ActiveSearch& as = *st.active_search;
  const int n = static_cast<int>(as.matches.size());
  const int idx = ((as.match_cursor + delta) % n + n) % n;
  long total = 0;
  std::string msg;
  Screen scr;
  if (!count_lines(path, total, msg)) return NavResult::failure(ResultKind::NotFound, msg);
  if (!build_screen(path, as.matches[static_cast<size_t>(idx)].line_number, total, st.page_size, scr, msg))
    return NavResult::failure(ResultKind::NotFound, msg);
  as.match_cursor = idx;
  st.cursor_line = scr.cursor;
  return NavResult::screen("Match " + std::to_string(idx + 1) + " of " + std::to_string(n), scr.text);
}

NavResult Navigator::next_match(const std::string& path) { return step_match(path, 1); }

NavResult Navigator::prev_match(const std::string& path) { return step_match(path, -1); }
