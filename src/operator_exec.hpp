#pragma once
/*
 * Operator executor
 *
 * Purpose: apply delete/change/yank to a span of an ITextArea and keep the
 *          single unnamed register; paste the register back.
 * Note: mode switching after a change is the caller's business.
 */
#include <optional>
#include <string>
#include "types.hpp"
#include "key_event.hpp"
#include "i_text_area.hpp"

enum class Operator { Delete, Change, Yank };

struct Register {
  std::string text;
  bool linewise = false;  // filled by dd/cc/yy; pastes as whole lines
  bool empty() const { return text.empty(); }
};

struct Span {
  Cursor start;
  Cursor end;
};

std::optional<Operator> operator_for_key(const KeyEvent& key);

// Copies [start, end) (either order) into reg. Delete/Change remove it,
// Yank leaves the text alone; the cursor ends at the span start either way.
// False when the span is empty; a linewise empty span still empties reg.
bool apply_operator(ITextArea& area, Register& reg, Operator op, Cursor start, Cursor end, bool linewise);

// count whole lines from row, with the trailing break unless the last
// covered line is the document's last line
Span line_span(const ITextArea& area, int row, int count);

// p (after) / P (before); no-op for an empty register
void paste(ITextArea& area, const Register& reg, bool after);
