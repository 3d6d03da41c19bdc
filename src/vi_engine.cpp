#include "vi_engine.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <string>
#include <utility>

// one undo step per dispatched Normal/Visual key
class EditGroup {
public:
  explicit EditGroup(ITextArea& area) : area_(area) { area_.begin_group(); }
  ~EditGroup() { area_.commit_group(); }
  EditGroup(const EditGroup&) = delete;
  EditGroup& operator=(const EditGroup&) = delete;
private:
  ITextArea& area_;
};

static bool usable_with_operator(MotionKind k) {
  switch (k) {
    case MotionKind::WordRight:
    case MotionKind::WordLeft:
    case MotionKind::WordEnd:
    case MotionKind::LineStart:
    case MotionKind::LineEnd:
    case MotionKind::FirstNonBlank:
      return true;
    default:
      return false;
  }
}

static bool usable_in_visual(MotionKind k) {
  switch (k) {
    case MotionKind::Left:
    case MotionKind::Right:
    case MotionKind::Up:
    case MotionKind::Down:
      return true;
    default:
      return usable_with_operator(k);
  }
}

ViEngine::ViEngine(ITextArea& area, const ViOptions& opts)
    : area_(area),
      opts_(opts),
      mode_(opts.vi_enabled ? opts.start_mode : Mode::Insert),
      enabled_(opts.vi_enabled) {}

bool ViEngine::handle_key(std::string_view key_id, std::optional<char> ch) {
  return handle_key(KeyEvent::from_name(key_id, ch));
}

bool ViEngine::handle_key(const KeyEvent& key) {
  if (!enabled_) return false;
  VLOG(2) << "key " << key_name(key) << " in " << mode_label(mode_);
  switch (mode_) {
    case Mode::Insert:
      return handle_insert_key(key);
    case Mode::Normal: {
      EditGroup group(area_);
      return handle_normal_key(key);
    }
    case Mode::Visual: {
      EditGroup group(area_);
      return handle_visual_key(key);
    }
  }
  return false;
}

void ViEngine::set_enabled(bool on) {
  if (on == enabled_) return;
  pending_.clear();
  if (on) {
    enabled_ = true;
    set_mode(opts_.start_mode);
  } else {
    if (mode_ == Mode::Visual) area_.move_cursor(area_.selection().start());
    set_mode(Mode::Insert);
    enabled_ = false;
  }
  VLOG(1) << "vi handling " << (enabled_ ? "enabled" : "disabled");
}

void ViEngine::apply_options(const ViOptions& opts) {
  opts_ = opts;
  set_enabled(opts.vi_enabled);
}

void ViEngine::set_mode(Mode m) {
  if (m == mode_) return;
  VLOG(1) << "mode " << mode_label(mode_) << " -> " << mode_label(m);
  mode_ = m;
  notifier_.emit(m);
}

bool ViEngine::handle_insert_key(const KeyEvent& key) {
  if (!key.is(ControlKey::Escape)) return false;
  set_mode(Mode::Normal);
  pending_.clear();
  Cursor c = area_.cursor_location();
  if (c.col > 0) area_.move_cursor({c.row, c.col - 1});
  return true;
}

bool ViEngine::handle_normal_key(const KeyEvent& key) {
  if (pending_.second_g) {
    if (key.is('g')) goto_row(pending_.has_count() ? count() - 1 : 0);
    pending_.clear();
    return true;
  }
  if (pending_.awaited) {
    if (auto c = key.glyph()) finish_char_search(*pending_.awaited, *c);
    pending_.clear();
    return true;
  }
  if (auto c = key.glyph(); c && pending_.consume_digit(*c)) return true;
  if (pending_.op) return handle_operator_key(key, *pending_.op);

  if (auto m = motion_for_key(key)) {
    if (m->kind == MotionKind::DocumentEnd && pending_.has_count()) goto_row(count() - 1);
    else run_motion(*m, count());
    pending_.clear();
    return true;
  }
  if (auto s = char_search_for_key(key)) { pending_.awaited = *s; return true; }
  if (auto op = operator_for_key(key)) { pending_.op = *op; return true; }

  Cursor cur = area_.cursor_location();
  switch (key.glyph().value_or('\0')) {
    case 'i': set_mode(Mode::Insert); break;
    case 'I': area_.cursor_line_start(); set_mode(Mode::Insert); break;
    case 'a': {
      int len = static_cast<int>(area_.document_line(cur.row).size());
      if (cur.col < len) area_.move_cursor({cur.row, cur.col + 1});
      set_mode(Mode::Insert);
    } break;
    case 'A': area_.cursor_line_end(); set_mode(Mode::Insert); break;
    case 'o':
      area_.cursor_line_end();
      area_.insert("\n");
      set_mode(Mode::Insert);
      break;
    case 'O':
      area_.cursor_line_start();
      area_.insert("\n");
      area_.cursor_up();
      set_mode(Mode::Insert);
      break;
    case 'v': enter_visual(); break;
    case 'g': pending_.second_g = true; return true;
    case 'x': edit({Change::DeleteChar, count()}); break;
    case 'X': edit({Change::DeleteCharBefore, count()}); break;
    case 'D': edit({Change::DeleteToLineEnd}); break;
    case 'C': edit({Change::ChangeToLineEnd}); break;
    case 's': edit({Change::Substitute, count()}); break;
    case 'S': edit({Change::SubstituteLine}); break;
    case 'J': edit({Change::JoinLines, count()}); break;
    case 'p': paste(area_, reg_, true); break;
    case 'P': paste(area_, reg_, false); break;
    case 'u': for (int i = count(); i > 0; --i) area_.undo(); break;
    case '.': replay(); break;
    default:
      if (key.is(ControlKey::CtrlR)) {
        for (int i = count(); i > 0; --i) area_.redo();
      }
      break;
  }
  pending_.clear();
  return true;
}

bool ViEngine::handle_operator_key(const KeyEvent& key, Operator op) {
  if (auto other = operator_for_key(key)) {
    if (*other != op) { pending_.op = *other; return true; }
    int n = count();
    if (line_operator(op, n) && op != Operator::Yank) record({Change::LineOperator, n, op});
    pending_.clear();
    return true;
  }
  if (auto s = char_search_for_key(key); s && *s != CharSearch::ReplaceOne) {
    pending_.awaited = *s;
    return true;
  }
  if (auto m = motion_for_key(key); m && usable_with_operator(m->kind)) {
    int n = count();
    if (operator_motion(op, *m, n) && op != Operator::Yank) record({Change::OperatorMotion, n, op, *m});
  }
  // anything else cancels the operator
  pending_.clear();
  return true;
}

bool ViEngine::handle_visual_key(const KeyEvent& key) {
  if (key.is(ControlKey::Escape) || key.is('v')) {
    leave_visual();
  } else if (auto m = motion_for_key(key); m && usable_in_visual(m->kind)) {
    apply_motion(area_, *m);
    area_.set_selection({visual_anchor_, area_.cursor_location()});
  } else if (key.is('d') || key.is('x')) {
    visual_operator(Operator::Delete);
  } else if (key.is('c')) {
    visual_operator(Operator::Change);
  } else if (key.is('y')) {
    visual_operator(Operator::Yank);
  }
  pending_.clear();
  return true;
}

void ViEngine::enter_visual() {
  visual_anchor_ = area_.cursor_location();
  area_.set_selection({visual_anchor_, visual_anchor_});
  set_mode(Mode::Visual);
}

void ViEngine::leave_visual() {
  area_.move_cursor(area_.selection().start());
  set_mode(Mode::Normal);
}

void ViEngine::run_motion(const Motion& m, int n) {
  Cursor start = area_.cursor_location();
  for (int i = 0; i < n; ++i) {
    if (!apply_motion(area_, m)) { area_.move_cursor(start); return; }
  }
}

void ViEngine::goto_row(int row) {
  row = std::clamp(row, 0, area_.line_count() - 1);
  area_.move_cursor({row, 0});
}

void ViEngine::finish_char_search(CharSearch s, char c) {
  if (s == CharSearch::ReplaceOne) {
    Change ch{Change::ReplaceChar, count()};
    ch.glyph = c;
    edit(ch);
    return;
  }
  Motion m{search_motion(s), c};
  if (!pending_.op) { run_motion(m, count()); return; }
  Operator op = *pending_.op;
  int n = count();
  if (operator_motion(op, m, n) && op != Operator::Yank) record({Change::OperatorMotion, n, op, m});
}

bool ViEngine::operator_motion(Operator op, const Motion& m, int n) {
  Cursor pre = area_.cursor_location();
  for (int i = 0; i < n; ++i) {
    if (!apply_motion(area_, m)) { area_.move_cursor(pre); return false; }
  }
  Cursor post = area_.cursor_location();
  if (post == pre) return false;
  Cursor start = std::min(pre, post);
  Cursor end = std::max(pre, post);
  if (is_inclusive(m.kind)) end = next_position(area_, end);
  apply_operator(area_, reg_, op, start, end, false);
  if (op == Operator::Change) set_mode(Mode::Insert);
  return true;
}

bool ViEngine::line_operator(Operator op, int n) {
  Span s = line_span(area_, area_.cursor_location().row, n);
  bool changed = apply_operator(area_, reg_, op, s.start, s.end, true);
  if (op == Operator::Change) set_mode(Mode::Insert);
  return changed;
}

void ViEngine::visual_operator(Operator op) {
  Selection sel = area_.selection();
  Cursor start = sel.start();
  Cursor end = next_position(area_, sel.end());
  int length = static_cast<int>(area_.text_range(start, end).size());
  apply_operator(area_, reg_, op, start, end, false);
  area_.move_cursor(start);
  set_mode(op == Operator::Change ? Mode::Insert : Mode::Normal);
  if (op != Operator::Yank && length > 0) {
    Change c{Change::VisualSpan, 1, op};
    c.length = length;
    record(c);
  }
}

bool ViEngine::delete_span(Operator op, int length) {
  std::string text = area_.full_text();
  Cursor start = area_.cursor_location();
  Cursor end = cursor_at_offset(text, offset_of(text, start) + length);
  bool changed = apply_operator(area_, reg_, op, start, end, false);
  if (op == Operator::Change) set_mode(Mode::Insert);
  return changed;
}

void ViEngine::edit(const Change& c) {
  if (apply_change(c)) record(c);
}

void ViEngine::record(const Change& c) {
  last_change_ = c;
  VLOG(1) << "last change " << describe(c);
}

bool ViEngine::apply_change(const Change& c) {
  std::string before = area_.full_text();
  int n = std::max(1, c.count);
  switch (c.type) {
    case Change::DeleteChar:
      for (int i = 0; i < n; ++i) area_.delete_right();
      break;
    case Change::DeleteCharBefore:
      for (int i = 0; i < n; ++i) area_.delete_left();
      break;
    case Change::DeleteToLineEnd:
      area_.delete_to_end_of_line();
      break;
    case Change::ChangeToLineEnd:
      area_.delete_to_end_of_line();
      set_mode(Mode::Insert);
      break;
    case Change::Substitute:
      for (int i = 0; i < n; ++i) area_.delete_right();
      set_mode(Mode::Insert);
      break;
    case Change::SubstituteLine:
      area_.cursor_line_start();
      area_.delete_to_end_of_line();
      set_mode(Mode::Insert);
      break;
    case Change::JoinLines:
      // nJ joins n lines, i.e. n-1 line breaks, at least one
      for (int i = std::max(1, n - 1); i > 0; --i) {
        if (area_.cursor_location().row + 1 >= area_.line_count()) break;
        area_.cursor_line_end();
        area_.delete_right();
        area_.insert(" ");
      }
      break;
    case Change::ReplaceChar: {
      Cursor cur = area_.cursor_location();
      int len = static_cast<int>(area_.document_line(cur.row).size());
      if (cur.col + n > len) break;
      area_.remove(cur, {cur.row, cur.col + n});
      area_.insert(std::string(static_cast<size_t>(n), c.glyph));
      area_.move_cursor({cur.row, cur.col + n - 1});
    } break;
    case Change::OperatorMotion:
      operator_motion(c.op, c.motion, n);
      break;
    case Change::LineOperator:
      line_operator(c.op, n);
      break;
    case Change::VisualSpan:
      delete_span(c.op, c.length);
      break;
  }
  return area_.full_text() != before;
}

void ViEngine::replay() {
  if (!last_change_) return;
  Change c = *last_change_;
  if (pending_.has_count()) c.count = count();
  VLOG(1) << "repeat " << describe(c);
  apply_change(c);
}
