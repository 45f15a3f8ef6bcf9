#include "nav_config.hpp"
#include "line_stream.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static bool parse_positive(const std::string& s, long long& out) {
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok || s.size() > 12) return false;
  out = std::stoll(s);
  return out >= 1;
}

static bool is_log_level(const std::string& v) {
  static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const char* l : levels) if (v == l) return true;
  return false;
}

bool apply_rc_line(const std::string& raw, NavConfig& cfg, std::string& msg) {
  std::string s = trim(raw);
  if (!s.empty() && s[0] == ':') s = trim(s.substr(1));
  std::istringstream in(s);
  std::string cmd, name, value, extra;
  in >> cmd >> name >> value;
  if (cmd != "set" || name.empty()) { msg = "unknown command: " + s; return false; }
  if (value.empty() || (in >> extra)) { msg = "set " + name + ": use :set " + name + " <value>"; return false; }

  long long n = 0;
  if (name == "pagesize") {
    if (!parse_positive(value, n) || n > 100000) { msg = "set pagesize: must be a number in 1..100000"; return false; }
    cfg.page_size = static_cast<int>(n);
  } else if (name == "chunksize") {
    if (!parse_positive(value, n) || n < 512 || n > (64LL << 20)) { msg = "set chunksize: must be 512..67108864 bytes"; return false; }
    cfg.chunk_size = static_cast<size_t>(n);
  } else if (name == "loglevel") {
    if (!is_log_level(value)) { msg = "set loglevel: use trace|debug|info|warn|error|critical|off"; return false; }
    cfg.log_level = value;
  } else if (name == "logfile") {
    cfg.log_file = value;
  } else {
    msg = "unknown option: " + name;
    return false;
  }
  msg = name + "=" + value;
  return true;
}

bool load_rc(const std::filesystem::path& path, NavConfig& cfg, std::vector<std::string>& messages) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  LineStream rc(path.string());
  std::string line;
  while (rc.next(line)) {
    std::string s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string m;
    if (!apply_rc_line(s, cfg, m)) {
      messages.push_back(path.string() + ":" + std::to_string(rc.line_number()) + ": " + m);
    }
  }
  if (rc.failed()) { messages.push_back(rc.error()); return false; }
  return true;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / ".fnavrc";
}
