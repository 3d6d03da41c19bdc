#pragma once
/*
 * Motion
 *
 * Purpose: resolve cursor motions (glyph/line/word/char-search) against an
 *          ITextArea, either standalone or as an operator's span boundary.
 * Design: word left/right and line/row moves delegate to the text area;
 *         word-end and in-line char search are computed here.
 */
#include <optional>
#include <string>
#include "types.hpp"
#include "key_event.hpp"
#include "i_text_area.hpp"

enum class MotionKind {
  Left, Right, Up, Down,
  WordRight, WordLeft, WordEnd,
  LineStart, LineEnd, FirstNonBlank,
  DocumentStart, DocumentEnd,
  FindForward, TillForward, FindBackward, TillBackward
};

// f / t / F / T, plus r which awaits a glyph the same way
enum class CharSearch { FindForward, TillForward, FindBackward, TillBackward, ReplaceOne };

struct Motion {
  MotionKind kind = MotionKind::Left;
  char target = 0;  // char-search motions only
  bool operator==(const Motion&) const = default;
};

std::optional<Motion> motion_for_key(const KeyEvent& key);
std::optional<CharSearch> char_search_for_key(const KeyEvent& key);
MotionKind search_motion(CharSearch s);
// an inclusive motion's span covers the glyph it lands on
bool is_inclusive(MotionKind k);

// moves the cursor; false when the motion has no target (search miss)
bool apply_motion(ITextArea& area, const Motion& m);

Cursor word_end_target(const std::string& text, Cursor from);
std::optional<int> search_in_line(const std::string& line, int col, MotionKind kind, char target);
int first_non_blank(const std::string& line);

int offset_of(const std::string& text, Cursor c);
Cursor cursor_at_offset(const std::string& text, int offset);
// one glyph forward, stepping over a line break; stays put at document end
Cursor next_position(const ITextArea& area, Cursor c);
