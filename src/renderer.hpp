#pragma once
/*
 * Renderer
 *
 * Purpose: render the text area, the Visual selection and the status line,
 *          and manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless apart from the caller-owned Viewport.
 */
#include <string>
#include "types.hpp"
#include "i_text_area.hpp"
#include "iterminal.hpp"

struct Viewport {
  int top_line = 0;
  int left_col = 0;
};

struct StatusInfo {
  Mode mode = Mode::Insert;
  bool vi_enabled = true;
  std::string pending;   // keys of an unfinished command, e.g. "2d"
  std::string message;
};

class Renderer {
public:
  void render(ITerminal& term, const ITextArea& area, Viewport& vp, const StatusInfo& status);
};

// "-- INSERT --" etc.; empty while vi handling is off
std::string mode_indicator(const StatusInfo& status);
