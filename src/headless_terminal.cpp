#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  grid_.assign(static_cast<size_t>(std::max(0, rows_)), std::string(static_cast<size_t>(std::max(0, cols_)), ' '));
}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) std::fill(r.begin(), r.end(), ' ');
  highlights_.clear();
}

void HeadlessTerminal::put(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  std::string& r = grid_[static_cast<size_t>(row)];
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    r[static_cast<size_t>(c)] = text[i];
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  put(row, col, text);
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_end > hl_start) highlights_.push_back({row, col + hl_start, hl_end - hl_start});
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  std::string& r = grid_[static_cast<size_t>(row)];
  for (int c = std::max(0, col); c < cols_; ++c) r[static_cast<size_t>(c)] = ' ';
}

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return -1;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (unsigned char c : keys) keys_.push_back(c);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  grid_.assign(static_cast<size_t>(std::max(0, rows_)), std::string(static_cast<size_t>(std::max(0, cols_)), ' '));
  highlights_.clear();
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  const std::string& r = grid_[static_cast<size_t>(row)];
  size_t end = r.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : r.substr(0, end + 1);
}
