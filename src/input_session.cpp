#include "input_session.hpp"
#include <glog/logging.h>

InputSession::InputSession(ITerminal& term, const ViOptions& opts)
    : term_(term), engine_(area_, opts) {
  // a stale message would sit next to the new mode label
  engine_.set_mode_changed_callback([this](Mode) { message_.clear(); });
}

InputSession::Outcome InputSession::run() {
  while (!outcome_) {
    render();
    std::optional<InputEvent> ev = term_.read_event();
    if (!ev) {
      LOG(WARNING) << "input closed before submit";
      outcome_ = Outcome::Aborted;
      break;
    }
    handle_event(*ev);
  }
  return *outcome_;
}

void InputSession::handle_event(const InputEvent& ev) {
  switch (ev.kind) {
    case InputEvent::Key: handle_key(ev.key); break;
    case InputEvent::Submit: outcome_ = Outcome::Submitted; break;
    case InputEvent::Abort: outcome_ = Outcome::Aborted; break;
    case InputEvent::ToggleVi:
      engine_.set_enabled(!engine_.enabled());
      message_ = engine_.enabled() ? "vimode on" : "vimode off";
      break;
    case InputEvent::Resize: break;
  }
}

void InputSession::handle_key(const KeyEvent& key) {
  if (engine_.handle_key(key)) return;
  default_key(key);
}

void InputSession::default_key(const KeyEvent& key) {
  if (auto c = key.glyph()) { area_.insert(std::string(1, *c)); return; }
  if (key.is(ControlKey::Enter)) area_.insert("\n");
  else if (key.is(ControlKey::Tab)) area_.insert("\t");
  else if (key.is(ControlKey::Backspace)) area_.delete_left();
  else if (key.is(ControlKey::Left)) area_.cursor_left();
  else if (key.is(ControlKey::Right)) area_.cursor_right();
  else if (key.is(ControlKey::Up)) area_.cursor_up();
  else if (key.is(ControlKey::Down)) area_.cursor_down();
}

void InputSession::render() {
  StatusInfo st;
  st.mode = engine_.mode();
  st.vi_enabled = engine_.enabled();
  st.pending = engine_.pending().keys();
  st.message = message_;
  renderer_.render(term_, area_, vp_, st);
}
