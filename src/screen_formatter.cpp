#include "screen_formatter.hpp"
#include <algorithm>

int digit_width(long n) {
  int digits = 1;
  if (n < 0) n = -n;
  while (n >= 10) { n /= 10; digits++; }
  return digits;
}

std::string eof_banner(long total_lines) {
  return "[END OF FILE - " + std::to_string(total_lines) + " lines total]";
}

std::string render_screen(const std::vector<LineEntry>& lines, long total_lines, int page_size) {
  if (lines.empty()) return "~\n(empty file)";

  const long last = lines.back().line_number;
  const int width = std::max(digit_width(total_lines), digit_width(last));
  std::string out;
  bool first = true;
  auto push_row = [&](const std::string& row) {
    if (!first) out.push_back('\n');
    out += row;
    first = false;
  };

  for (const auto& e : lines) {
    std::string num = std::to_string(e.line_number);
    std::string pad(static_cast<size_t>(std::max(0, width - static_cast<int>(num.size()))), ' ');
    push_row(pad + num + " | " + e.content);
  }

  if (last >= total_lines) {
    const std::string filler = std::string(static_cast<size_t>(width), ' ') + "~";
    for (int i = static_cast<int>(lines.size()); i < page_size; ++i) push_row(filler);
    push_row(eof_banner(total_lines));
  }
  return out;
}
