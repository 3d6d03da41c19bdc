#include "key_event.hpp"

static bool is_printable(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return u >= 32 && u != 127;
}

KeyEvent KeyEvent::from_name(std::string_view name, std::optional<char> ch) {
  if (name == "escape") return control(ControlKey::Escape);
  if (name == "left") return control(ControlKey::Left);
  if (name == "right") return control(ControlKey::Right);
  if (name == "up") return control(ControlKey::Up);
  if (name == "down") return control(ControlKey::Down);
  if (name == "ctrl+r") return control(ControlKey::CtrlR);
  if (name == "enter") return control(ControlKey::Enter);
  if (name == "backspace") return control(ControlKey::Backspace);
  if (name == "tab") return control(ControlKey::Tab);
  if (ch && is_printable(*ch)) return glyph(*ch);
  return control(ControlKey::Other);
}

std::string key_name(const KeyEvent& k) {
  if (auto c = k.glyph()) return std::string(1, *c);
  if (k.is(ControlKey::Escape)) return "escape";
  if (k.is(ControlKey::Left)) return "left";
  if (k.is(ControlKey::Right)) return "right";
  if (k.is(ControlKey::Up)) return "up";
  if (k.is(ControlKey::Down)) return "down";
  if (k.is(ControlKey::CtrlR)) return "ctrl+r";
  if (k.is(ControlKey::Enter)) return "enter";
  if (k.is(ControlKey::Backspace)) return "backspace";
  if (k.is(ControlKey::Tab)) return "tab";
  return "other";
}
