#include <ncurses.h>
#include "pager.hpp"
#include "search_engine.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <sstream>
#include <spdlog/spdlog.h>

static constexpr int CTRL_b = 'B'-64;
static constexpr int CTRL_f = 'F'-64;
static constexpr int CTRL_l = 'L'-64;
static constexpr int ESC = 27;
static constexpr long kMaxCount = 1000000000000L;

static std::vector<std::string> split_rows(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  for (;;) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) { out.push_back(text.substr(start)); break; }
    out.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

Pager::Pager(ITerminal& term, std::string path, const NavConfig& cfg)
  : term_(term), path_(std::move(path)), store_(cfg.page_size), nav_(store_, cfg.chunk_size) {
  page_height_ = fit_height();
  register_commands();
}

// one row for the status line, one for the end-of-file banner
int Pager::fit_height() const { return std::max(1, term_.get_size().rows - 2); }

long Pager::cursor_line() const {
  const NavigatorState* st = store_.find(path_);
  return st ? st->cursor_line : 1;
}

bool Pager::open() {
  NavResult r = nav_.go_to_line(path_, 1, page_height_);
  apply(r);
  return r.ok();
}

void Pager::run() {
  while (!should_quit_) {
    render();
    int ch = term_.read_key();
    if (ch < 0) break;
    handle_input(ch);
  }
}

void Pager::render() {
  PagerFrame f;
  f.rows = &rows_;
  f.file = path_;
  f.cursor_line = cursor_line();
  f.mode = mode_;
  f.message = message_;
  f.cmdline = cmdline_;
  f.highlight = highlight_ ? &*highlight_ : nullptr;
  renderer_.render(term_, f);
}

void Pager::apply(const NavResult& r) {
  if (!r.ok()) {
    spdlog::warn("{}: {} ({})", path_, r.text, result_kind_name(r.kind));
    message_ = r.text;
    return;
  }
  if (r.kind == ResultKind::Info) { message_ = r.text; return; }
  rows_ = split_rows(r.body());
  message_ = r.status;
}

void Pager::go_to(long line) { apply(nav_.go_to_line(path_, line, page_height_)); }

void Pager::find(const std::string& pattern, bool is_regex) {
  spdlog::debug("find {} regex={}", pattern, is_regex);
  NavResult r = nav_.find(path_, pattern, is_regex);
  if (r.kind == ResultKind::Screen) {
    LinePattern re;
    std::string msg;
    if (re.compile(pattern, is_regex, msg)) highlight_ = std::move(re);
  } else if (r.kind == ResultKind::Info) {
    highlight_.reset();
  }
  apply(r);
}

void Pager::handle_input(int ch) {
  if (ch == KEY_RESIZE) {
    page_height_ = fit_height();
    go_to(cursor_line());
    return;
  }
  if (mode_ == PagerMode::Normal) handle_normal_input(ch);
  else handle_cmdline_input(ch);
}

void Pager::handle_normal_input(int ch) {
  if (ch >= '1' && ch <= '9') { pending_count_ = std::min(pending_count_ * 10 + (ch - '0'), kMaxCount); return; }
  if (ch == '0' && pending_count_ > 0) { pending_count_ = std::min(pending_count_ * 10, kMaxCount); return; }
  long count = pending_count_;
  pending_count_ = 0;
  if (ch != 'g') pending_g_ = false;
  switch (ch) {
    case 'g':
      if (pending_g_) { pending_g_ = false; go_to(count > 0 ? count : 1); }
      else { pending_g_ = true; pending_count_ = count; }
      break;
    case 'G': go_to(count > 0 ? count : LONG_MAX); break;
    case CTRL_f: case ' ': case 'f': case KEY_NPAGE: apply(nav_.page_down(path_)); break;
    case CTRL_b: case 'b': case KEY_PPAGE: apply(nav_.page_up(path_)); break;
    case 'n': apply(nav_.next_match(path_)); break;
    case 'N': apply(nav_.prev_match(path_)); break;
    case ':': mode_ = PagerMode::Command; cmdline_.clear(); break;
    case '/': mode_ = PagerMode::Search; cmdline_.clear(); break;
    case 'q': should_quit_ = true; break;
    case CTRL_l: break;
    default: break;
  }
}

void Pager::handle_cmdline_input(int ch) {
  if (ch == ESC) { mode_ = PagerMode::Normal; cmdline_.clear(); return; }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
    if (cmdline_.empty()) mode_ = PagerMode::Normal;
    else cmdline_.pop_back();
    return;
  }
  if (ch == '\n' || ch == '\r' || ch == KEY_ENTER) {
    PagerMode m = mode_;
    mode_ = PagerMode::Normal;
    if (m == PagerMode::Search) {
      if (!cmdline_.empty()) find(cmdline_, false);
    } else {
      execute_command();
    }
    cmdline_.clear();
    return;
  }
  if (ch >= 32 && ch <= 126) cmdline_.push_back(static_cast<char>(ch));
}

void Pager::execute_command() {
  if (all_digits(cmdline_)) {
    go_to(cmdline_.size() > 18 ? LONG_MAX : std::stol(cmdline_));
    return;
  }
  if (cmdline_.rfind("re ", 0) == 0) {
    std::string pat = cmdline_.substr(3);
    if (pat.empty()) { message_ = "re: use :re <regex>"; return; }
    find(pat, true);
    return;
  }
  std::istringstream iss(cmdline_);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    auto r = registry_.execute(composite, subargs);
    message_ = r ? *r : "unknown command: " + composite;
    return;
  }
  auto r = registry_.execute(cmd, args);
  message_ = r ? *r : "unknown command: " + cmd;
}

void Pager::register_commands() {
  auto quit = [this](const std::vector<std::string>&) { should_quit_ = true; return std::string(); };
  registry_.register_command("q", "", quit);
  registry_.register_command("quit", "", quit);
  registry_.register_command("noh", "", [this](const std::vector<std::string>&) {
    highlight_.reset();
    return std::string();
  });
  registry_.register_command("set pagesize", "<n>", [this](const std::vector<std::string>& args) {
    if (args.size() != 1 || !all_digits(args[0]) || args[0].size() > 6) return std::string("set pagesize: use :set pagesize <n>");
    int n = std::stoi(args[0]);
    if (n < 1) return std::string("set pagesize: must be >= 1");
    page_height_ = n;
    message_.clear();
    go_to(cursor_line());
    return message_.empty() ? "pagesize=" + args[0] : message_;
  });
  registry_.register_command("help", "", [this](const std::vector<std::string>&) {
    return registry_.help() + "  :<line>  :re <regex>";
  });
}
