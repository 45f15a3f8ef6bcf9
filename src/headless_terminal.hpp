#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests; keeps a character grid,
 *          records highlighted spans and replays a scripted key queue.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  struct Span { int row; int col; int len; };

  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void refresh() override { ++refreshes_; }
  void clear_to_eol(int row, int col) override;
  int read_key() override;

  void push_keys(const std::string& keys);
  void push_key(int key) { keys_.push_back(key); }
  void resize(int rows, int cols);

  // row text with trailing blanks removed
  std::string row_text(int row) const;
  const std::vector<Span>& highlights() const { return highlights_; }
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text);

  int rows_;
  int cols_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
  std::vector<std::string> grid_;
  std::vector<Span> highlights_;
  std::deque<int> keys_;
};
