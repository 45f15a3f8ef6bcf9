#include "renderer.hpp"
#include <algorithm>

static const std::string kSep = " | ";

// draws one screen row, marking the first pattern hit inside the line content
static void draw_row(ITerminal& term, int row, const std::string& s, int cols, const LinePattern* hl) {
  std::string vis = s.substr(0, static_cast<size_t>(std::max(0, cols)));
  if (hl) {
    size_t sep = s.find(kSep);
    if (sep != std::string::npos) {
      size_t body = sep + kSep.size();
      size_t pos = 0, len = 0;
      if (hl->first_hit(s.substr(body), pos, len) && len > 0 && body + pos < vis.size()) {
        // the hit may run past the right edge; only the visible part is marked
        const size_t shown = std::min(len, vis.size() - (body + pos));
        term.draw_highlighted(row, 0, vis, static_cast<int>(body + pos), static_cast<int>(shown));
        term.clear_to_eol(row, static_cast<int>(vis.size()));
        return;
      }
    }
  }
  term.draw_text(row, 0, vis);
  term.clear_to_eol(row, static_cast<int>(vis.size()));
}

void Renderer::render(ITerminal& term, const PagerFrame& frame) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = rows - 1;
  if (frame.rows) {
    int n = std::min(max_text_rows, static_cast<int>(frame.rows->size()));
    for (int i = 0; i < n; ++i) draw_row(term, i, (*frame.rows)[static_cast<size_t>(i)], cols, frame.highlight);
  }

  std::string status;
  if (frame.mode == PagerMode::Command) status = ":" + frame.cmdline;
  else if (frame.mode == PagerMode::Search) status = "/" + frame.cmdline;
  else {
    status = frame.file + "  line:" + std::to_string(frame.cursor_line);
    if (!frame.message.empty()) status += "  | " + frame.message;
  }
  if (rows > 0) {
    std::string vis = status.substr(0, static_cast<size_t>(std::max(0, cols)));
    term.draw_text(rows - 1, 0, vis);
    term.clear_to_eol(rows - 1, static_cast<int>(vis.size()));
    if (frame.mode == PagerMode::Normal) term.move_cursor(0, 0);
    else term.move_cursor(rows - 1, std::min(static_cast<int>(vis.size()), std::max(0, cols - 1)));
  }
  term.refresh();
}
