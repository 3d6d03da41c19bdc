#include "text_area.hpp"
#include <algorithm>
#include "char_class.hpp"

TextArea::TextArea(const std::string& text) { set_text(text); }

void TextArea::set_text(const std::string& text) {
  buf_.init_from_text(text);
  um_ = UndoManager();
  group_depth_ = 0;
  sel_ = Selection{};
}

void TextArea::move_cursor(Cursor pos) {
  pos = buf_.clamp(pos);
  sel_ = {pos, pos};
}

void TextArea::cursor_left() {
  Cursor c = sel_.active;
  if (c.col > 0) c.col--;
  else if (c.row > 0) { c.row--; c.col = buf_.line_length(c.row); }
  move_cursor(c);
}

void TextArea::cursor_right() {
  Cursor c = sel_.active;
  if (c.col < buf_.line_length(c.row)) c.col++;
  else if (c.row + 1 < buf_.line_count()) { c.row++; c.col = 0; }
  move_cursor(c);
}

void TextArea::cursor_up() {
  Cursor c = sel_.active;
  if (c.row > 0) c.row--;
  move_cursor(c);
}

void TextArea::cursor_down() {
  Cursor c = sel_.active;
  if (c.row + 1 < buf_.line_count()) c.row++;
  move_cursor(c);
}

void TextArea::cursor_word_right() {
  Cursor c = sel_.active;
  const std::string s = buf_.line(c.row);
  int len = static_cast<int>(s.size());
  if (c.col >= len) {
    if (c.row + 1 < buf_.line_count()) move_cursor({c.row + 1, 0});
    return;
  }
  int col = c.col;
  unsigned char first = static_cast<unsigned char>(s[col]);
  if (!is_space(first)) {
    while (col < len && same_class(first, static_cast<unsigned char>(s[col]))) col++;
  }
  while (col < len && is_space(static_cast<unsigned char>(s[col]))) col++;
  move_cursor({c.row, col});
}

void TextArea::cursor_word_left() {
  Cursor c = sel_.active;
  if (c.col == 0) {
    if (c.row > 0) move_cursor({c.row - 1, buf_.line_length(c.row - 1)});
    return;
  }
  const std::string s = buf_.line(c.row);
  int col = std::min(c.col, static_cast<int>(s.size())) - 1;
  while (col > 0 && is_space(static_cast<unsigned char>(s[col]))) col--;
  unsigned char cls = static_cast<unsigned char>(s[col]);
  if (!is_space(cls)) {
    while (col > 0 && same_class(cls, static_cast<unsigned char>(s[col - 1]))) col--;
  }
  move_cursor({c.row, col});
}

void TextArea::cursor_line_start() { move_cursor({sel_.active.row, 0}); }
void TextArea::cursor_line_end() { move_cursor({sel_.active.row, buf_.line_length(sel_.active.row)}); }

void TextArea::delete_left() {
  Cursor c = sel_.active;
  if (c.col > 0) remove({c.row, c.col - 1}, c);
  else if (c.row > 0) remove({c.row - 1, buf_.line_length(c.row - 1)}, c);
}

void TextArea::delete_right() {
  Cursor c = sel_.active;
  if (c.col < buf_.line_length(c.row)) remove(c, {c.row, c.col + 1});
  else if (c.row + 1 < buf_.line_count()) remove(c, {c.row + 1, 0});
}

void TextArea::delete_to_end_of_line() {
  Cursor c = sel_.active;
  remove(c, {c.row, buf_.line_length(c.row)});
}

void TextArea::insert(const std::string& text) {
  if (text.empty()) return;
  begin_group();
  Cursor at = sel_.active;
  Cursor end = buf_.insert_text(at, text);
  um_.push_op({Operation::InsertText, at, end, text});
  move_cursor(end);
  commit_group();
}

void TextArea::remove(Cursor start, Cursor end) {
  start = buf_.clamp(start); end = buf_.clamp(end);
  if (end < start) std::swap(start, end);
  if (start == end) { move_cursor(start); return; }
  begin_group();
  std::string removed = buf_.erase_range(start, end);
  um_.push_op({Operation::DeleteText, start, end, removed});
  move_cursor(start);
  commit_group();
}

void TextArea::set_selection(const Selection& sel) {
  sel_ = {buf_.clamp(sel.anchor), buf_.clamp(sel.active)};
}

std::string TextArea::selected_text() const { return buf_.text_range(sel_.start(), sel_.end()); }

void TextArea::undo() {
  Cursor c = sel_.active;
  if (um_.undo(buf_, c)) move_cursor(c);
}

void TextArea::redo() {
  Cursor c = sel_.active;
  if (um_.redo(buf_, c)) move_cursor(c);
}

void TextArea::begin_group() {
  if (group_depth_++ == 0) um_.begin_group(sel_.active);
}

void TextArea::commit_group() {
  if (group_depth_ == 0) return;
  if (--group_depth_ == 0) um_.commit_group(sel_.active);
}
