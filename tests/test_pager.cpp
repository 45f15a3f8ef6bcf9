#include <ncurses.h>
#include "pager.hpp"
#include "headless_terminal.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>

static void type(Pager& p, const std::string& keys) {
  for (unsigned char c : keys) p.handle_input(c);
}

static void test_open_and_paging(const std::string& path) {
  HeadlessTerminal term(12, 80);
  NavConfig cfg;
  Pager p(term, path, cfg);
  assert(p.page_height() == 10);
  assert(p.open());
  assert(p.cursor_line() == 1);
  assert(p.rows().size() == 10);

  p.render();
  assert(term.row_text(0) == "   1 | Line 1: This is a regular line in the file");
  assert(term.row_text(9).rfind("  10 | ", 0) == 0);
  assert(term.row_text(11) == path + "  line:1");

  type(p, " ");
  assert(p.cursor_line() == 11);
  p.handle_input(KEY_NPAGE);
  assert(p.cursor_line() == 21);
  type(p, "b");
  assert(p.cursor_line() == 11);
  p.handle_input('B' - 64);
  assert(p.cursor_line() == 1);

  type(p, "42G");
  assert(p.cursor_line() == 42);
  type(p, "gg");
  assert(p.cursor_line() == 1);
  type(p, "7gg");
  assert(p.cursor_line() == 7);

  // last page: one line, fillers, banner
  type(p, "G");
  assert(p.cursor_line() == 5000);
  assert(p.rows().size() == 11);
  assert(p.rows().back() == "[END OF FILE - 5000 lines total]");
  p.render();
  assert(term.row_text(10) == "[END OF FILE - 5000 lines total]");
  assert(term.row_text(1) == "    ~");

  type(p, "99999G");
  assert(p.cursor_line() == 5000);
}

static void test_search_keys(const std::string& path) {
  HeadlessTerminal term(12, 80);
  NavConfig cfg;
  Pager p(term, path, cfg);
  assert(p.open());

  type(p, "n");
  assert(p.message() == "No active search. Use 'find' first.");
  assert(p.cursor_line() == 1);

  type(p, "/FIND");
  assert(p.mode() == PagerMode::Search);
  p.render();
  assert(term.row_text(11) == "/FIND");
  type(p, "ME\n");
  assert(p.mode() == PagerMode::Normal);
  assert(p.cursor_line() == 1000);
  assert(p.message() == "Found match 1 of 5");

  p.render();
  const std::string row0 = "1000 | Line 1000: This is a SPECIAL line with keyword FINDME";
  assert(term.row_text(0) == row0);
  assert(term.highlights().size() == 1);
  assert(term.highlights()[0].row == 0);
  assert(term.highlights()[0].col == static_cast<int>(row0.find("FINDME")));
  assert(term.highlights()[0].len == 6);
  assert(term.row_text(11) == path + "  line:1000  | Found match 1 of 5");

  type(p, "n");
  assert(p.cursor_line() == 2000 && p.message() == "Match 2 of 5");
  type(p, "NN");
  assert(p.cursor_line() == 5000 && p.message() == "Match 5 of 5");

  type(p, ":re Line 4\\d{3}:\n");
  assert(p.message() == "Found match 1 of 1000");
  assert(p.cursor_line() == 4000);
  p.render();
  assert(!term.highlights().empty());
  assert(term.highlights()[0].col == 7);

  type(p, ":noh\n");
  p.render();
  assert(term.highlights().empty());
  // matches survive :noh
  type(p, "n");
  assert(p.cursor_line() == 4001);

  type(p, "/nothing here\n");
  assert(p.message() == "Pattern not found: \"nothing here\"");
  assert(p.cursor_line() == 4001);

  type(p, ":re (\n");
  assert(p.message().rfind("Invalid regex pattern: ", 0) == 0);
}

static void test_commands(const std::string& path) {
  HeadlessTerminal term(12, 80);
  NavConfig cfg;
  Pager p(term, path, cfg);
  assert(p.open());

  type(p, ":25\n");
  assert(p.cursor_line() == 25);

  type(p, ":set pagesize 5\n");
  assert(p.page_height() == 5);
  assert(p.message() == "pagesize=5");
  assert(p.rows().size() == 5);
  type(p, " ");
  assert(p.cursor_line() == 30);

  type(p, ":set pagesize=0\n");
  assert(p.page_height() == 5);
  type(p, ":set pagesize x\n");
  assert(p.message() == "set pagesize: use :set pagesize <n>");

  type(p, ":bogus\n");
  assert(p.message() == "unknown command: bogus");
  type(p, ":help\n");
  assert(contains(p.message(), "noh"));

  // escape and backspace leave command mode without running anything
  type(p, ":1");
  p.handle_input(27);
  assert(p.mode() == PagerMode::Normal);
  assert(p.cursor_line() == 30);
  type(p, ":");
  p.handle_input(127);
  assert(p.mode() == PagerMode::Normal);

  term.resize(22, 80);
  p.handle_input(KEY_RESIZE);
  assert(p.page_height() == 20);
  assert(p.rows().size() == 20);

  type(p, ":q\n");
  assert(p.should_quit());
}

static void test_run_loop(const std::string& path) {
  HeadlessTerminal term(8, 60);
  NavConfig cfg;
  Pager p(term, path, cfg);
  assert(p.open());
  term.push_keys("G");
  term.push_key('q');
  term.push_key(KEY_NPAGE);
  p.run();
  assert(p.should_quit());
  assert(p.cursor_line() == 5000);
  assert(term.refresh_count() == 2);

  // running out of keys ends the loop too
  Pager p2(term, path, cfg);
  assert(p2.open());
  p2.run();
  assert(!p2.should_quit());
  assert(p2.cursor_line() == 7);
}

static void test_long_line_highlight(const TempDir& dir) {
  const std::string wide(250000, 'a');
  std::string path = write_file(dir, "wide.txt", "first\n" + wide + "b\nlast\n");
  HeadlessTerminal term(6, 40);
  NavConfig cfg;
  Pager p(term, path, cfg);
  assert(p.open());

  type(p, ":re a+b\n");
  assert(p.message() == "Found match 1 of 1");
  assert(p.cursor_line() == 2);
  p.render();
  // the hit runs past the right edge, only the visible part is marked
  assert(term.row_text(0) == "2 | " + std::string(36, 'a'));
  assert(term.highlights().size() == 1);
  assert(term.highlights()[0].col == 4 && term.highlights()[0].len == 36);

  type(p, ":re \\w+z\n");
  assert(p.message() == "Pattern not found: \"\\w+z\"");
  assert(p.cursor_line() == 2);

  type(p, "/A.*Z\n");
  assert(p.message() == "Pattern not found: \"A.*Z\"");
  type(p, ":re a.*b\n");
  p.render();
  assert(term.highlights().size() == 1);
}

static void test_missing_file(const TempDir& dir) {
  HeadlessTerminal term(10, 40);
  NavConfig cfg;
  std::string missing = dir.file("missing.txt");
  Pager p(term, missing, cfg);
  assert(!p.open());
  assert(p.message() == "File not found: " + missing);
}

int main() {
  TempDir dir;
  std::string path = write_large_fixture(dir, 5000);
  test_open_and_paging(path);
  test_search_keys(path);
  test_commands(path);
  test_run_loop(path);
  test_long_line_highlight(dir);
  test_missing_file(dir);
  return 0;
}
