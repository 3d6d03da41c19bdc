#include "change.hpp"

static char op_char(Operator op) {
  switch (op) {
    case Operator::Delete: return 'd';
    case Operator::Change: return 'c';
    case Operator::Yank: return 'y';
  }
  return '?';
}

std::string describe(const Change& c) {
  std::string n = std::to_string(c.count);
  switch (c.type) {
    case Change::DeleteChar: return n + "x";
    case Change::DeleteCharBefore: return n + "X";
    case Change::DeleteToLineEnd: return "D";
    case Change::ChangeToLineEnd: return "C";
    case Change::Substitute: return n + "s";
    case Change::SubstituteLine: return "S";
    case Change::JoinLines: return n + "J";
    case Change::ReplaceChar: return n + "r" + std::string(1, c.glyph);
    case Change::OperatorMotion:
      return n + op_char(c.op) + "{motion " + std::to_string(static_cast<int>(c.motion.kind)) + "}";
    case Change::LineOperator: return n + std::string(2, op_char(c.op));
    case Change::VisualSpan: return std::string("v") + op_char(c.op) + "[" + std::to_string(c.length) + "]";
  }
  return "?";
}
