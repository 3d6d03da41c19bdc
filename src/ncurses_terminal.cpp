#include "ncurses_terminal.hpp"
#include <algorithm>

static constexpr int ESC = 27;
static constexpr int CTRL_C = 3;
static constexpr int CTRL_D = 4;
static constexpr int CTRL_R = 18;
static constexpr int CTRL_V = 22;

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(1, -1, -1);
    } else {
      init_pair(1, COLOR_WHITE, COLOR_BLACK); // fallback
    }
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  hl_start = std::min(hl_start, len);
  int hl_end = std::min(len, hl_start + hl_len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
    col += hl_start;
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) {
    mvaddnstr(row, col, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

std::optional<InputEvent> NcursesTerminal::read_event() {
  int ch = getch();
  if (ch == ERR) return std::nullopt;
  return event_from_curses(ch);
}

InputEvent event_from_curses(int ch) {
  auto key = [](ControlKey k) { return InputEvent{InputEvent::Key, KeyEvent::control(k)}; };
  switch (ch) {
    case CTRL_D: return {InputEvent::Submit};
    case CTRL_C: return {InputEvent::Abort};
    case CTRL_V: return {InputEvent::ToggleVi};
    case KEY_RESIZE: return {InputEvent::Resize};
    case CTRL_R: return key(ControlKey::CtrlR);
    case ESC: return key(ControlKey::Escape);
    case KEY_LEFT: return key(ControlKey::Left);
    case KEY_RIGHT: return key(ControlKey::Right);
    case KEY_UP: return key(ControlKey::Up);
    case KEY_DOWN: return key(ControlKey::Down);
    case '\n': case '\r': case KEY_ENTER: return key(ControlKey::Enter);
    case KEY_BACKSPACE: case 127: case 8: return key(ControlKey::Backspace);
    case '\t': return key(ControlKey::Tab);
    default: break;
  }
  if (ch >= 32 && ch < 127) return {InputEvent::Key, KeyEvent::glyph(static_cast<char>(ch))};
  return key(ControlKey::Other);
}
