#pragma once
/*
 * KeyEvent
 *
 * Purpose: one key press as delivered by the host widget.
 * Design: either a named control key or a printable glyph, never both.
 */
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class ControlKey { Escape, Left, Right, Up, Down, CtrlR, Enter, Backspace, Tab, Other };

class KeyEvent {
public:
  static KeyEvent control(ControlKey k) { return KeyEvent(k); }
  static KeyEvent glyph(char c) { return KeyEvent(c); }
  // key names follow the host toolkit: "escape", "left", "ctrl+r", ...
  static KeyEvent from_name(std::string_view name, std::optional<char> ch);

  bool is(ControlKey k) const {
    const ControlKey* p = std::get_if<ControlKey>(&v_);
    return p && *p == k;
  }
  bool is(char c) const {
    const char* p = std::get_if<char>(&v_);
    return p && *p == c;
  }
  std::optional<char> glyph() const {
    if (const char* p = std::get_if<char>(&v_)) return *p;
    return std::nullopt;
  }

private:
  explicit KeyEvent(ControlKey k) : v_(k) {}
  explicit KeyEvent(char c) : v_(c) {}
  std::variant<ControlKey, char> v_;
};

std::string key_name(const KeyEvent& k);
