#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

void HeadlessTerminal::clear() {
  grid_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' '));
  hl_.assign(static_cast<size_t>(rows_), std::vector<bool>(static_cast<size_t>(cols_), false));
}

void HeadlessTerminal::put(int row, int col, char c, bool hl) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  grid_[row][col] = c;
  hl_[row][col] = hl;
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  for (size_t i = 0; i < text.size(); ++i) put(row, col + static_cast<int>(i), text[i], false);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  for (int i = 0; i < len; ++i) put(row, col + i, text[i], i >= hl_start && i < hl_end);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  for (int c = std::max(0, col); c < cols_; ++c) put(row, c, ' ', false);
}

std::optional<InputEvent> HeadlessTerminal::read_event() {
  if (input_.empty()) return std::nullopt;
  InputEvent ev = input_.front();
  input_.pop_front();
  return ev;
}

void HeadlessTerminal::push_keys(const std::string& glyphs) {
  for (char c : glyphs) push_key(KeyEvent::glyph(c));
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return {};
  std::string s = grid_[row];
  size_t e = s.find_last_not_of(' ');
  return e == std::string::npos ? std::string() : s.substr(0, e + 1);
}

std::string HeadlessTerminal::highlighted(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  for (int c = 0; c < cols_; ++c) if (hl_[row][c]) out.push_back(grid_[row][c]);
  return out;
}
