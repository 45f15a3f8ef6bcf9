#include "screen_formatter.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<LineEntry> window(long first, long count) {
  std::vector<LineEntry> w;
  for (long i = first; i < first + count; ++i) w.push_back({i, "text " + std::to_string(i)});
  return w;
}

int main() {
  assert(digit_width(0) == 1);
  assert(digit_width(9) == 1);
  assert(digit_width(10) == 2);
  assert(digit_width(100000) == 6);

  assert(render_screen({}, 0, 30) == "~\n(empty file)");

  // mid-file window: numbers padded to the width of the total, no banner
  {
    std::string s = render_screen(window(8, 3), 120, 3);
    assert(s == "  8 | text 8\n  9 | text 9\n 10 | text 10");
  }
  // width is the digit count of the total wherever the window is
  {
    std::string top = render_screen(window(1, 2), 100000, 2);
    std::string mid = render_screen(window(54321, 2), 100000, 2);
    assert(top.rfind("     1 | ", 0) == 0);
    assert(mid.rfind(" 54321 | ", 0) == 0);
  }
  // window reaching the end: filler up to page size, then the banner
  {
    std::string s = render_screen(window(9, 2), 10, 4);
    assert(s == " 9 | text 9\n10 | text 10\n  ~\n  ~\n[END OF FILE - 10 lines total]");
  }
  // a full last page gets the banner but no filler
  {
    std::string s = render_screen(window(1, 3), 3, 3);
    assert(s == "1 | text 1\n2 | text 2\n3 | text 3\n[END OF FILE - 3 lines total]");
  }
  // content is copied verbatim
  {
    std::vector<LineEntry> w{{1, "  a | b\t"}};
    assert(render_screen(w, 5, 1) == "1 |   a | b\t");
  }
  assert(eof_banner(100000) == "[END OF FILE - 100000 lines total]");
  return 0;
}
