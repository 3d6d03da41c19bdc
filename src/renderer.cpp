#include "renderer.hpp"
#include <algorithm>
#include <sstream>

std::string mode_indicator(const StatusInfo& status) {
  if (!status.vi_enabled) return {};
  return "-- " + std::string(mode_label(status.mode)) + " --";
}

void Renderer::render(ITerminal& term, const ITextArea& area, Viewport& vp, const StatusInfo& status) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(0, rows - 1);
  Cursor cur = area.cursor_location();
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (cur.row >= vp.top_line + max_text_rows) vp.top_line = cur.row - max_text_rows + 1;
  if (cols > 0) {
    if (cur.col < vp.left_col) vp.left_col = cur.col;
    else if (cur.col >= vp.left_col + cols) vp.left_col = cur.col - cols + 1;
  }
  if (vp.top_line < 0) vp.top_line = 0;
  if (vp.left_col < 0) vp.left_col = 0;

  bool visual = status.vi_enabled && status.mode == Mode::Visual;
  Selection sel = area.selection();
  Cursor s0 = sel.start(), s1 = sel.end();

  for (int i = 0; i < max_text_rows; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= area.line_count()) break;
    std::string s = area.document_line(line_idx);
    int s_len = static_cast<int>(s.size());
    int start_col = std::min(vp.left_col, s_len);
    int end_col = std::min(s_len, start_col + cols);
    std::string vis = s.substr(start_col, end_col - start_col);
    if (visual && line_idx >= s0.row && line_idx <= s1.row) {
      // inclusive selection; one cell past the text stands for the line break
      int c0 = line_idx == s0.row ? s0.col : 0;
      int c1 = line_idx == s1.row ? s1.col + 1 : s_len + 1;
      if (c1 > s_len && end_col == s_len) vis.push_back(' ');
      int hs = std::clamp(c0 - start_col, 0, static_cast<int>(vis.size()));
      int he = std::clamp(c1 - start_col, hs, static_cast<int>(vis.size()));
      term.draw_highlighted(i, 0, vis, hs, he - hs);
    } else {
      term.draw_text(i, 0, vis);
    }
    term.clear_to_eol(i, static_cast<int>(vis.size()));
  }

  std::ostringstream oss;
  oss << mode_indicator(status);
  if (!status.pending.empty()) oss << "  " << status.pending;
  oss << (status.vi_enabled ? "  " : "") << (cur.row + 1) << ":" << (cur.col + 1);
  if (!status.message.empty()) oss << "  | " << status.message;
  std::string line = oss.str();
  if (static_cast<int>(line.size()) > cols) line.resize(static_cast<size_t>(std::max(0, cols)));
  if (rows > 0) {
    term.draw_text(rows - 1, 0, line);
    term.clear_to_eol(rows - 1, static_cast<int>(line.size()));
  }

  int screen_row = cur.row - vp.top_line;
  if (screen_row >= 0 && screen_row < max_text_rows) {
    int screen_col = std::max(0, cur.col - vp.left_col);
    screen_col = std::min(screen_col, std::max(0, cols - 1));
    term.move_cursor(screen_row, screen_col);
  } else {
    term.move_cursor(std::max(0, rows - 1), 0);
  }
  term.refresh();
}
