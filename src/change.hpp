#pragma once
/*
 * Change
 *
 * Purpose: shape of the last mutating Normal/Visual command, kept for '.'.
 * Design: closed set of command types plus their parameters; replay
 *         re-runs the command from the current cursor.
 */
#include <string>
#include "motion.hpp"
#include "operator_exec.hpp"

struct Change {
  enum Type {
    DeleteChar,        // x
    DeleteCharBefore,  // X
    DeleteToLineEnd,   // D
    ChangeToLineEnd,   // C
    Substitute,        // s
    SubstituteLine,    // S
    JoinLines,         // J
    ReplaceChar,       // r{c}
    OperatorMotion,    // d{motion} c{motion}
    LineOperator,      // dd cc
    VisualSpan         // d/x/c in Visual mode
  } type;
  int count = 1;
  Operator op = Operator::Delete;
  Motion motion{};
  int length = 0;  // VisualSpan: glyphs covered, line breaks included
  char glyph = 0;  // ReplaceChar

  bool operator==(const Change&) const = default;
};

std::string describe(const Change& c);
