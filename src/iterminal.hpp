#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, input).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <optional>
#include <string>
#include "key_event.hpp"

struct TermSize { int rows; int cols; };

// what the host reads from the terminal: a key for the widget, or one of
// the host's own commands
struct InputEvent {
  enum Kind { Key, Submit, Abort, ToggleVi, Resize } kind = Key;
  KeyEvent key = KeyEvent::control(ControlKey::Other);
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // nullopt once the input source is exhausted
  virtual std::optional<InputEvent> read_event() = 0;
};
