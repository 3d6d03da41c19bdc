#include "motion.hpp"
#include <algorithm>
#include "char_class.hpp"

std::optional<Motion> motion_for_key(const KeyEvent& key) {
  if (key.is(ControlKey::Left)) return Motion{MotionKind::Left};
  if (key.is(ControlKey::Right)) return Motion{MotionKind::Right};
  if (key.is(ControlKey::Up)) return Motion{MotionKind::Up};
  if (key.is(ControlKey::Down)) return Motion{MotionKind::Down};
  auto ch = key.glyph();
  if (!ch) return std::nullopt;
  switch (*ch) {
    case 'h': return Motion{MotionKind::Left};
    case 'l': return Motion{MotionKind::Right};
    case 'k': return Motion{MotionKind::Up};
    case 'j': return Motion{MotionKind::Down};
    case 'w': return Motion{MotionKind::WordRight};
    case 'b': return Motion{MotionKind::WordLeft};
    case 'e': return Motion{MotionKind::WordEnd};
    case '0': return Motion{MotionKind::LineStart};
    case '$': return Motion{MotionKind::LineEnd};
    case '^': return Motion{MotionKind::FirstNonBlank};
    case 'G': return Motion{MotionKind::DocumentEnd};
    default: return std::nullopt;
  }
}

std::optional<CharSearch> char_search_for_key(const KeyEvent& key) {
  auto ch = key.glyph();
  if (!ch) return std::nullopt;
  switch (*ch) {
    case 'f': return CharSearch::FindForward;
    case 't': return CharSearch::TillForward;
    case 'F': return CharSearch::FindBackward;
    case 'T': return CharSearch::TillBackward;
    case 'r': return CharSearch::ReplaceOne;
    default: return std::nullopt;
  }
}

MotionKind search_motion(CharSearch s) {
  switch (s) {
    case CharSearch::FindForward: return MotionKind::FindForward;
    case CharSearch::TillForward: return MotionKind::TillForward;
    case CharSearch::FindBackward: return MotionKind::FindBackward;
    case CharSearch::TillBackward: return MotionKind::TillBackward;
    case CharSearch::ReplaceOne: break;
  }
  return MotionKind::FindForward;
}

bool is_inclusive(MotionKind k) {
  return k == MotionKind::WordEnd || k == MotionKind::FindForward || k == MotionKind::TillForward;
}

bool apply_motion(ITextArea& area, const Motion& m) {
  switch (m.kind) {
    case MotionKind::Left: area.cursor_left(); return true;
    case MotionKind::Right: area.cursor_right(); return true;
    case MotionKind::Up: area.cursor_up(); return true;
    case MotionKind::Down: area.cursor_down(); return true;
    case MotionKind::WordRight: area.cursor_word_right(); return true;
    case MotionKind::WordLeft: area.cursor_word_left(); return true;
    case MotionKind::WordEnd:
      area.move_cursor(word_end_target(area.full_text(), area.cursor_location()));
      return true;
    case MotionKind::LineStart: area.cursor_line_start(); return true;
    case MotionKind::LineEnd: area.cursor_line_end(); return true;
    case MotionKind::FirstNonBlank: {
      int row = area.cursor_location().row;
      area.move_cursor({row, first_non_blank(area.document_line(row))});
      return true;
    }
    case MotionKind::DocumentStart: area.move_cursor({0, 0}); return true;
    case MotionKind::DocumentEnd: area.move_cursor(area.document_end()); return true;
    case MotionKind::FindForward:
    case MotionKind::TillForward:
    case MotionKind::FindBackward:
    case MotionKind::TillBackward: {
      Cursor c = area.cursor_location();
      auto col = search_in_line(area.document_line(c.row), c.col, m.kind, m.target);
      if (!col) return false;
      area.move_cursor({c.row, *col});
      return true;
    }
  }
  return false;
}

Cursor word_end_target(const std::string& text, Cursor from) {
  int n = static_cast<int>(text.size());
  int pos = offset_of(text, from);
  while (pos < n && !is_space(static_cast<unsigned char>(text[pos]))) pos++;
  while (pos < n && is_space(static_cast<unsigned char>(text[pos]))) pos++;
  while (pos < n && !is_space(static_cast<unsigned char>(text[pos]))) pos++;
  if (pos > 0) pos--;
  return cursor_at_offset(text, pos);
}

std::optional<int> search_in_line(const std::string& line, int col, MotionKind kind, char target) {
  switch (kind) {
    case MotionKind::FindForward:
    case MotionKind::TillForward: {
      size_t idx = line.find(target, static_cast<size_t>(col) + 1);
      if (idx == std::string::npos) return std::nullopt;
      int to = static_cast<int>(idx);
      if (kind == MotionKind::TillForward) to--;
      return std::max(col, to);
    }
    case MotionKind::FindBackward:
    case MotionKind::TillBackward: {
      if (col <= 0) return std::nullopt;
      size_t idx = line.rfind(target, static_cast<size_t>(col) - 1);
      if (idx == std::string::npos) return std::nullopt;
      int to = static_cast<int>(idx);
      if (kind == MotionKind::TillBackward) to++;
      return std::min(col, to);
    }
    default:
      return std::nullopt;
  }
}

int first_non_blank(const std::string& line) {
  for (size_t i = 0; i < line.size(); ++i) {
    if (!is_space(static_cast<unsigned char>(line[i]))) return static_cast<int>(i);
  }
  return 0;
}

int offset_of(const std::string& text, Cursor c) {
  int row = 0;
  size_t st = 0;
  while (row < c.row) {
    size_t nl = text.find('\n', st);
    if (nl == std::string::npos) break;
    st = nl + 1;
    row++;
  }
  size_t line_end = text.find('\n', st);
  if (line_end == std::string::npos) line_end = text.size();
  return static_cast<int>(std::min(st + static_cast<size_t>(std::max(0, c.col)), line_end));
}

Cursor cursor_at_offset(const std::string& text, int offset) {
  offset = std::clamp(offset, 0, static_cast<int>(text.size()));
  Cursor c;
  for (int i = 0; i < offset; ++i) {
    if (text[static_cast<size_t>(i)] == '\n') { c.row++; c.col = 0; }
    else c.col++;
  }
  return c;
}

Cursor next_position(const ITextArea& area, Cursor c) {
  int len = static_cast<int>(area.document_line(c.row).size());
  if (c.col < len) return {c.row, c.col + 1};
  if (c.row + 1 < area.line_count()) return {c.row + 1, 0};
  return c;
}
