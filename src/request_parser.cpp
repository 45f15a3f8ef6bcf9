#include "request_parser.hpp"
#include <cctype>

static inline bool is_space(unsigned char c) { return std::isspace(c) != 0; }

bool is_skippable_request(const std::string& line) {
  size_t i = 0;
  while (i < line.size() && is_space((unsigned char)line[i])) i++;
  return i == line.size() || line[i] == '#';
}

// reads one whitespace separated token starting at i; quotes group, backslash escapes inside quotes
static bool next_token(const std::string& s, size_t& i, std::string& tok, std::string& msg) {
  tok.clear();
  bool in_quote = false;
  while (i < s.size()) {
    char c = s[i];
    if (in_quote) {
      if (c == '\\' && i + 1 < s.size() && (s[i + 1] == '"' || s[i + 1] == '\\')) { tok.push_back(s[i + 1]); i += 2; continue; }
      if (c == '"') { in_quote = false; i++; continue; }
      tok.push_back(c); i++;
      continue;
    }
    if (is_space((unsigned char)c)) break;
    if (c == '"') { in_quote = true; i++; continue; }
    tok.push_back(c); i++;
  }
  if (in_quote) { msg = "unterminated quote"; return false; }
  return true;
}

bool parse_request(const std::string& line, Request& out, std::string& msg) {
  out = Request{};
  size_t i = 0;
  auto skip_ws = [&]{ while (i < line.size() && is_space((unsigned char)line[i])) i++; };
  skip_ws();
  while (i < line.size() && !is_space((unsigned char)line[i])) out.tool.push_back(line[i++]);
  if (out.tool.empty()) { msg = "empty request"; return false; }

  std::string tok;
  for (;;) {
    skip_ws();
    if (i >= line.size()) break;
    size_t start = i;
    size_t eq = line.find('=', start);
    if (eq == std::string::npos) { msg = "expected key=value near: " + line.substr(start); return false; }
    std::string key = line.substr(start, eq - start);
    bool bad_key = key.empty();
    for (unsigned char c : key) if (!(std::isalnum(c) || c == '_')) bad_key = true;
    if (bad_key) { msg = "bad argument name near: " + line.substr(start); return false; }
    i = eq + 1;
    if (!next_token(line, i, tok, msg)) return false;
    if (!out.args.emplace(key, tok).second) { msg = "duplicate argument: " + key; return false; }
  }
  return true;
}
