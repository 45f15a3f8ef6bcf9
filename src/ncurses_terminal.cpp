#include "ncurses_terminal.hpp"
#include <algorithm>
#include <clocale>

NcursesTerminal::NcursesTerminal() {
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, COLOR_BLACK, COLOR_CYAN);
    else init_pair(1, COLOR_BLACK, COLOR_WHITE);
  }
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  const attr_t hl = has_colors() ? (attr_t)COLOR_PAIR(1) : (attr_t)A_REVERSE;
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
  }
  if (hl_end > hl_start) {
    attron(hl);
    mvaddnstr(row, col + hl_start, text.c_str() + hl_start, hl_end - hl_start);
    attroff(hl);
  }
  if (hl_end < len) {
    mvaddnstr(row, col + hl_end, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() {
  int ch = getch();
  return ch == ERR ? -1 : ch;
}
