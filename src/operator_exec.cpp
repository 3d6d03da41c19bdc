#include "operator_exec.hpp"
#include <algorithm>

std::optional<Operator> operator_for_key(const KeyEvent& key) {
  if (key.is('d')) return Operator::Delete;
  if (key.is('c')) return Operator::Change;
  if (key.is('y')) return Operator::Yank;
  return std::nullopt;
}

bool apply_operator(ITextArea& area, Register& reg, Operator op, Cursor start, Cursor end, bool linewise) {
  if (end < start) std::swap(start, end);
  if (start == end) {
    // an empty line still replaces the register
    if (linewise) reg = {std::string(), true};
    return false;
  }
  reg.text = area.text_range(start, end);
  reg.linewise = linewise;
  switch (op) {
    case Operator::Yank: area.move_cursor(start); break;
    case Operator::Delete:
    case Operator::Change: area.remove(start, end); break;
  }
  return true;
}

Span line_span(const ITextArea& area, int row, int count) {
  int last_row = area.line_count() - 1;
  int last = std::min(row + std::max(1, count) - 1, last_row);
  Span s{{row, 0}, {last, static_cast<int>(area.document_line(last).size())}};
  if (last < last_row) s.end = {last + 1, 0};
  return s;
}

static void paste_lines(ITextArea& area, std::string body, bool after) {
  if (!body.empty() && body.back() == '\n') body.pop_back();
  int row = area.cursor_location().row;
  if (!after) {
    area.move_cursor({row, 0});
    area.insert(body + "\n");
    area.move_cursor({row, 0});
    return;
  }
  if (row + 1 < area.line_count()) {
    area.move_cursor({row + 1, 0});
    area.insert(body + "\n");
  } else {
    area.cursor_line_end();
    area.insert("\n" + body);
  }
  area.move_cursor({row + 1, 0});
}

void paste(ITextArea& area, const Register& reg, bool after) {
  if (reg.empty()) return;
  if (reg.linewise) { paste_lines(area, reg.text, after); return; }
  Cursor c = area.cursor_location();
  if (after) {
    int len = static_cast<int>(area.document_line(c.row).size());
    area.move_cursor({c.row, std::min(c.col + 1, len)});
  }
  area.insert(reg.text);
  Cursor end = area.cursor_location();
  if (end.col > 0) area.move_cursor({end.row, end.col - 1});
}
