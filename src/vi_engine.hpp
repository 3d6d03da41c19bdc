#pragma once
/*
 * ViEngine
 *
 * Purpose: vi key grammar for one text-input widget. The host hands every
 *          key to handle_key(); a true return means the key was consumed
 *          and the widget must not apply its default behaviour.
 * State: mode, pending composition, unnamed register, last change.
 * Design: one handler per mode; each Normal/Visual key runs inside one
 *         undo group of the text area so `u` reverts a command as a whole.
 */
#include <optional>
#include <string_view>
#include <utility>
#include "types.hpp"
#include "key_event.hpp"
#include "i_text_area.hpp"
#include "composition.hpp"
#include "change.hpp"
#include "operator_exec.hpp"
#include "mode_notifier.hpp"
#include "options.hpp"

class ViEngine {
public:
  explicit ViEngine(ITextArea& area, const ViOptions& opts = ViOptions{});

  bool handle_key(const KeyEvent& key);
  bool handle_key(std::string_view key_id, std::optional<char> ch);

  // invoked once per real mode transition
  void set_mode_changed_callback(ModeNotifier::Handler h) { notifier_.set_callback(std::move(h)); }
  ModeNotifier& mode_events() { return notifier_; }

  void set_enabled(bool on);
  bool enabled() const { return enabled_; }
  void apply_options(const ViOptions& opts);

  Mode mode() const { return mode_; }
  const Composition& pending() const { return pending_; }
  bool composing() const { return !pending_.empty(); }
  const Register& yank_register() const { return reg_; }
  const std::optional<Change>& last_change() const { return last_change_; }

private:
  bool handle_insert_key(const KeyEvent& key);
  bool handle_normal_key(const KeyEvent& key);
  bool handle_operator_key(const KeyEvent& key, Operator op);
  bool handle_visual_key(const KeyEvent& key);

  void set_mode(Mode m);
  void enter_visual();
  void leave_visual();
  int count() const { return pending_.count_value(opts_.max_count); }

  void run_motion(const Motion& m, int n);
  void goto_row(int row);
  void finish_char_search(CharSearch s, char c);
  bool operator_motion(Operator op, const Motion& m, int n);
  bool line_operator(Operator op, int n);
  void visual_operator(Operator op);
  bool delete_span(Operator op, int length);

  void edit(const Change& c);
  // true when the text changed
  bool apply_change(const Change& c);
  void record(const Change& c);
  void replay();

  ITextArea& area_;
  ViOptions opts_;
  Mode mode_ = Mode::Insert;
  bool enabled_ = true;
  Composition pending_;
  Register reg_;
  std::optional<Change> last_change_;
  Cursor visual_anchor_{0, 0};
  ModeNotifier notifier_;
};
