#pragma once
/*
 * InputSession
 *
 * Purpose: one interactive text-input session: a TextArea driven by a
 *          ViEngine, drawn through a Renderer on some ITerminal.
 * Flow: read_event -> host command or key; keys go to the engine first and
 *       get default widget behaviour only when the engine leaves them.
 */
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "options.hpp"
#include "renderer.hpp"
#include "text_area.hpp"
#include "vi_engine.hpp"

class InputSession {
public:
  enum class Outcome { Submitted, Aborted };

  InputSession(ITerminal& term, const ViOptions& opts);

  void set_text(const std::string& text) { area_.set_text(text); }
  void set_message(const std::string& msg) { message_ = msg; }
  // loops until submit/abort; a closed input source counts as abort
  Outcome run();
  void handle_event(const InputEvent& ev);

  std::string text() const { return area_.full_text(); }
  const TextArea& area() const { return area_; }
  const ViEngine& engine() const { return engine_; }
  const std::string& message() const { return message_; }
  std::optional<Outcome> outcome() const { return outcome_; }

private:
  void handle_key(const KeyEvent& key);
  void default_key(const KeyEvent& key);
  void render();

  ITerminal& term_;
  TextArea area_;
  ViEngine engine_;
  Renderer renderer_;
  Viewport vp_;
  std::string message_;
  std::optional<Outcome> outcome_;
};
