#pragma once
/*
 * Pager
 *
 * Purpose: interactive full-screen viewer; maps vim keys onto Navigator operations.
 * Keys: C-f/space/PgDn page down, C-b/PgUp page up, gg/G/<n>G jump, n/N matches,
 *       /text literal find, :N line, :re <regex>, :set pagesize <n>, :noh, :q.
 * Dependency: ITerminal for drawing and keys; state in its own StateStore.
 */
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "nav_config.hpp"
#include "state_store.hpp"
#include "navigator.hpp"
#include "renderer.hpp"
#include "search_engine.hpp"
#include "cmd_registry.hpp"

class Pager {
public:
  Pager(ITerminal& term, std::string path, const NavConfig& cfg);
  Pager(const Pager&) = delete;
  Pager& operator=(const Pager&) = delete;

  // shows the first page; false (with message()) if the file can't be read
  bool open();
  void run();
  void render();
  void handle_input(int ch);

  bool should_quit() const { return should_quit_; }
  const std::string& message() const { return message_; }
  long cursor_line() const;
  int page_height() const { return page_height_; }
  PagerMode mode() const { return mode_; }
  const std::vector<std::string>& rows() const { return rows_; }
  Navigator& navigator() { return nav_; }

private:
  void apply(const NavResult& r);
  void go_to(long line);
  void find(const std::string& pattern, bool is_regex);
  void execute_command();
  void register_commands();
  void handle_normal_input(int ch);
  void handle_cmdline_input(int ch);
  int fit_height() const;

  ITerminal& term_;
  std::string path_;
  StateStore store_;
  Navigator nav_;
  Renderer renderer_;
  CommandRegistry registry_;
  PagerMode mode_ = PagerMode::Normal;
  std::string cmdline_;
  std::string message_;
  std::vector<std::string> rows_;
  std::optional<LinePattern> highlight_;
  bool pending_g_ = false;
  long pending_count_ = 0;
  bool should_quit_ = false;
  int page_height_ = 1;
};
