#include "search_engine.hpp"
#include "line_stream.hpp"

bool LinePattern::compile(const std::string& pattern, bool is_regex, std::string& msg) {
  RE2::Options opts;
  opts.set_case_sensitive(false);
  opts.set_literal(!is_regex);
  opts.set_log_errors(false);
  auto re = std::make_unique<re2::RE2>(pattern, opts);
  if (!re->ok()) {
    msg = "Invalid regex pattern: " + re->error();
    return false;
  }
  re_ = std::move(re);
  return true;
}

bool LinePattern::matches(const std::string& line) const {
  return re_ && RE2::PartialMatch(line, *re_);
}

bool LinePattern::first_hit(const std::string& text, size_t& pos, size_t& len) const {
  if (!re_) return false;
  re2::StringPiece hit;
  if (!re_->Match(text, 0, text.size(), RE2::UNANCHORED, &hit, 1)) return false;
  pos = static_cast<size_t>(hit.data() - text.data());
  len = hit.size();
  return true;
}

SearchEngine::Status SearchEngine::search(const std::string& path, const std::string& pattern, bool is_regex,
                                          long cursor_line, SearchOutcome& out, std::string& msg) const {
  out = SearchOutcome{};
  LinePattern re;
  if (!re.compile(pattern, is_regex, msg)) return Status::InvalidPattern;

  LineStream s(path, chunk_size_);
  std::string line;
  while (s.next(line)) {
    if (!re.matches(line)) continue;
    long n = s.line_number();
    if (out.landed_index < 0 && n >= cursor_line) out.landed_index = static_cast<int>(out.matches.size());
    out.matches.push_back({n, line});
    if (out.matches.size() >= max_results_) {
      // later lines are not scanned, so the count is a lower bound
      out.capped = true;
      break;
    }
  }
  if (s.failed()) {
    out = SearchOutcome{};
    msg = s.error();
    return Status::NotFound;
  }
  if (out.landed_index < 0 && !out.matches.empty()) out.landed_index = 0;
  return Status::Ok;
}
