#include "vi_engine.hpp"
#include "text_area.hpp"
#include <cassert>
#include <optional>
#include <string>
#include <vector>

static ViOptions start_in(Mode m) {
  ViOptions o;
  o.start_mode = m;
  return o;
}

struct Fixture {
  TextArea area;
  ViEngine vi;
  explicit Fixture(const std::string& text, const ViOptions& opts = start_in(Mode::Normal))
      : area(text), vi(area, opts) {}
  void keys(const std::string& ks) {
    for (char c : ks) assert(vi.handle_key(KeyEvent::glyph(c)));
  }
  bool press(ControlKey k) { return vi.handle_key(KeyEvent::control(k)); }
  bool esc() { return press(ControlKey::Escape); }
  std::string text() const { return area.full_text(); }
  Cursor cur() const { return area.cursor_location(); }
  bool idle() const { return vi.pending() == Composition{}; }
};

static void test_delete_word_then_counted_x() {
  Fixture f("hello world");
  f.keys("dw");
  assert(f.text() == "world");
  assert((f.cur() == Cursor{0, 0}));
  assert(f.vi.yank_register().text == "hello ");
  assert(!f.vi.yank_register().linewise);
  f.keys("3x");
  assert(f.text() == "ld");
  assert(f.idle());
  assert((f.vi.last_change() == Change{Change::DeleteChar, 3}));
}

static void test_visual_yank() {
  Fixture f("abcdef");
  f.keys("vll");
  assert(f.vi.mode() == Mode::Visual);
  assert(f.area.selected_text() == "ab");
  f.keys("y");
  assert(f.text() == "abcdef");
  assert(f.vi.yank_register().text == "abc");
  assert((f.cur() == Cursor{0, 0}));
  assert(f.vi.mode() == Mode::Normal);
  assert(f.area.selection().empty());
  assert(!f.vi.last_change());
}

static void test_append_then_escape() {
  Fixture f("ab");
  f.area.move_cursor({0, 1});
  f.keys("a");
  assert(f.vi.mode() == Mode::Insert);
  assert((f.cur() == Cursor{0, 2}));
  assert(f.esc());
  assert(f.vi.mode() == Mode::Normal);
  assert((f.cur() == Cursor{0, 1}));
}

static void test_counted_motion() {
  const std::string text = "0123456789\n1\n2\n3\n4";
  Fixture a(text), b(text);
  a.keys("3j");
  b.keys("jjj");
  assert(a.cur() == b.cur());
  assert((a.cur() == Cursor{3, 0}));
  a.keys("9j");
  assert((a.cur() == Cursor{4, 0}));
  a.area.move_cursor({0, 0});
  a.keys("4l");
  assert((a.cur() == Cursor{0, 4}));
  a.keys("2h");
  assert((a.cur() == Cursor{0, 2}));
  assert(a.idle());

  Fixture capped(text, [] { ViOptions o = start_in(Mode::Normal); o.max_count = 3; return o; }());
  capped.keys("99j");
  assert((capped.cur() == Cursor{3, 0}));
}

static void test_dd_and_undo() {
  Fixture f("a\nb\nc");
  f.keys("jdd");
  assert(f.text() == "a\nc");
  assert((f.cur() == Cursor{1, 0}));
  assert(f.vi.yank_register().text == "b\n");
  assert(f.vi.yank_register().linewise);
  f.keys("u");
  assert(f.text() == "a\nb\nc");
  assert((f.cur() == Cursor{1, 0}));

  // on the last line there is no trailing break to take; the line empties
  Fixture g("a\nb");
  g.keys("jdd");
  assert(g.text() == "a\n");
  assert(g.area.line_count() == 2);
  assert((g.cur() == Cursor{1, 0}));
  assert(g.vi.yank_register().text == "b");
  assert(g.vi.yank_register().linewise);
  g.keys("p");
  assert(g.text() == "a\n\nb");
  assert((g.cur() == Cursor{2, 0}));

  Fixture h("a\nb\nc\nd");
  h.keys("2dd");
  assert(h.text() == "c\nd");
  assert(h.vi.yank_register().text == "a\nb\n");
  assert((h.vi.last_change() == Change{Change::LineOperator, 2, Operator::Delete}));
  h.keys(".");
  assert(h.text().empty());
  assert(h.area.line_count() == 1);
}

static void test_yank_line_and_paste() {
  Fixture f("one\ntwo\nthree");
  f.keys("yy");
  assert(f.text() == "one\ntwo\nthree");
  assert(f.vi.yank_register().text == "one\n");
  f.keys("jp");
  assert(f.text() == "one\ntwo\none\nthree");
  assert(f.area.line_count() == 4);
  assert((f.cur() == Cursor{2, 0}));
  f.keys("ggP");
  assert(f.text() == "one\none\ntwo\none\nthree");
  assert((f.cur() == Cursor{0, 0}));
  // neither yank nor paste is repeatable
  assert(!f.vi.last_change());
}

static void test_empty_line_yank_replaces_register() {
  Fixture f("abc\n");
  f.keys("yw");
  assert(f.vi.yank_register().text == "abc");
  f.keys("jyy");
  assert(f.vi.yank_register().empty());
  assert(f.vi.yank_register().linewise);
  f.keys("p");
  assert(f.text() == "abc\n");

  Fixture d("abc\n");
  d.keys("ywjdd");
  assert(d.vi.yank_register().empty());
  assert(!d.vi.last_change());
  d.keys("P");
  assert(d.text() == "abc\n");
}

static void test_charwise_paste() {
  Fixture f("abc def");
  f.keys("dw");
  assert(f.text() == "def");
  f.keys("p");
  assert(f.text() == "dabc ef");
  assert((f.cur() == Cursor{0, 4}));
  f.keys("0P");
  assert(f.text() == "abc dabc ef");
  assert((f.cur() == Cursor{0, 3}));

  Fixture empty("xyz");
  empty.keys("p");
  assert(empty.text() == "xyz");
}

static void test_pending_always_clears() {
  Fixture f("abc def");
  f.keys("2d");
  assert(f.vi.composing());
  assert(f.esc());
  assert(f.idle());
  f.keys("dq");
  assert(f.idle());
  f.keys("dh");
  assert(f.idle());
  f.keys("gx");
  assert(f.idle());
  f.keys("fz");
  assert(f.idle());
  assert((f.cur() == Cursor{0, 0}));
  f.keys("dfz");
  assert(f.idle());
  f.keys("3");
  f.esc();
  assert(f.idle());
  f.keys("r");
  f.esc();
  assert(f.idle());
  f.keys("f");
  assert(f.press(ControlKey::Left));
  assert(f.idle());
  assert(f.text() == "abc def");
  assert(!f.vi.last_change());
}

static void test_repeat() {
  Fixture f("abcdef");
  f.keys(".");
  assert(f.text() == "abcdef");
  assert(f.idle());
  f.keys("x");
  assert(f.text() == "bcdef");
  f.keys(".");
  assert(f.text() == "cdef");
  // a count before '.' replaces the recorded one for this replay only
  f.keys("2.");
  assert(f.text() == "ef");
  f.keys(".");
  assert(f.text() == "f");
  assert((f.vi.last_change() == Change{Change::DeleteChar, 1}));

  // commands that change nothing leave the last change alone
  Fixture noop("abc");
  noop.keys("x");
  noop.keys("J");
  noop.keys("5rq");
  assert(noop.text() == "bc");
  assert((noop.vi.last_change() == Change{Change::DeleteChar, 1}));
  noop.keys(".");
  assert(noop.text() == "c");

  Fixture g("abc def");
  g.keys("x");
  g.keys("yw");
  assert(g.vi.yank_register().text == "bc ");
  g.keys(".");
  assert(g.text() == "c def");
}

static void test_operator_motions() {
  Fixture a("abc def ghi"), b("abc def ghi");
  a.keys("d2w");
  b.keys("2dw");
  assert(a.text() == "ghi");
  assert(b.text() == "ghi");
  assert(a.vi.last_change() == b.vi.last_change());

  Fixture e("foo bar baz");
  e.keys("de");
  assert(e.text() == " baz");

  Fixture t("ab,cd");
  t.keys("dt,");
  assert(t.text() == ",cd");
  Fixture ff("ab,cd");
  ff.keys("df,");
  assert(ff.text() == "cd");
  assert(ff.vi.yank_register().text == "ab,");
  Fixture back("ab,cd");
  back.area.move_cursor({0, 4});
  back.keys("dFa");
  assert(back.text() == "d");
  assert((back.cur() == Cursor{0, 0}));

  Fixture dl("hello world");
  dl.area.move_cursor({0, 6});
  dl.keys("d$");
  assert(dl.text() == "hello ");
  Fixture d0("hello world");
  d0.area.move_cursor({0, 6});
  d0.keys("d0");
  assert(d0.text() == "world");
  assert((d0.cur() == Cursor{0, 0}));
  Fixture dc("   xyz");
  dc.area.move_cursor({0, 5});
  dc.keys("d^");
  assert(dc.text() == "   z");
  assert((dc.cur() == Cursor{0, 3}));
  Fixture db("abc def");
  db.area.move_cursor({0, 4});
  db.keys("db");
  assert(db.text() == "def");

  Fixture cw("foo bar");
  cw.keys("cw");
  assert(cw.text() == "bar");
  assert(cw.vi.mode() == Mode::Insert);
  assert(cw.vi.last_change()->op == Operator::Change);

  Fixture y("hello");
  y.area.move_cursor({0, 2});
  y.keys("y$");
  assert(y.text() == "hello");
  assert(y.vi.yank_register().text == "llo");
  assert((y.cur() == Cursor{0, 2}));
  assert(!y.vi.last_change());

  // a second, different operator replaces the pending one
  Fixture sw("abc\ndef");
  sw.keys("dcc");
  assert(sw.text() == "def");
  assert(sw.vi.mode() == Mode::Insert);

  Fixture repeat("a b c d");
  repeat.keys("dw");
  repeat.keys(".");
  assert(repeat.text() == "c d");
}

static void test_single_key_edits() {
  Fixture x("hello");
  x.keys("X");
  assert(x.text() == "hello");
  x.area.move_cursor({0, 2});
  x.keys("2X");
  assert(x.text() == "llo");
  assert((x.cur() == Cursor{0, 0}));

  Fixture d("hello world");
  d.area.move_cursor({0, 5});
  d.keys("D");
  assert(d.text() == "hello");
  assert(d.vi.mode() == Mode::Normal);
  Fixture c("hello world");
  c.area.move_cursor({0, 5});
  c.keys("C");
  assert(c.text() == "hello");
  assert(c.vi.mode() == Mode::Insert);

  Fixture s("abc");
  s.keys("2s");
  assert(s.text() == "c");
  assert(s.vi.mode() == Mode::Insert);
  Fixture sl("  abc\nx");
  sl.area.move_cursor({0, 3});
  sl.keys("S");
  assert(sl.text() == "\nx");
  assert((sl.cur() == Cursor{0, 0}));
  assert(sl.vi.mode() == Mode::Insert);

  Fixture j("a\nb\nc");
  j.keys("J");
  assert(j.text() == "a b\nc");
  j.keys("u3J");
  assert(j.text() == "a b c");
  j.keys("J");
  assert(j.text() == "a b c");

  Fixture r("abc");
  r.keys("rx");
  assert(r.text() == "xbc");
  assert((r.cur() == Cursor{0, 0}));
  r.keys("l2rz");
  assert(r.text() == "xzz");
  assert((r.cur() == Cursor{0, 2}));
  r.keys("0");
  r.keys(".");
  assert(r.text() == "zzz");
  r.keys("5rq");
  assert(r.text() == "zzz");
}

static void test_insert_entries() {
  Fixture f("abc");
  f.area.move_cursor({0, 2});
  f.keys("I");
  assert((f.cur() == Cursor{0, 0}));
  assert(f.vi.mode() == Mode::Insert);
  f.esc();
  f.keys("A");
  assert((f.cur() == Cursor{0, 3}));
  f.esc();
  assert((f.cur() == Cursor{0, 2}));

  Fixture o("ab\ncd");
  o.keys("o");
  assert(o.text() == "ab\n\ncd");
  assert((o.cur() == Cursor{1, 0}));
  assert(o.vi.mode() == Mode::Insert);
  assert(!o.vi.handle_key(KeyEvent::glyph('z')));

  Fixture up("ab");
  up.keys("O");
  assert(up.text() == "\nab");
  assert((up.cur() == Cursor{0, 0}));
  assert(up.vi.mode() == Mode::Insert);
}

static void test_goto_lines() {
  Fixture f("a\nb\nc\nd");
  f.keys("G");
  assert((f.cur() == Cursor{3, 1}));
  f.keys("gg");
  assert((f.cur() == Cursor{0, 0}));
  f.keys("3G");
  assert((f.cur() == Cursor{2, 0}));
  f.keys("2gg");
  assert((f.cur() == Cursor{1, 0}));
  f.keys("9G");
  assert((f.cur() == Cursor{3, 0}));
  assert(f.idle());
}

static void test_visual_edits() {
  Fixture f("abcdef");
  f.keys("vlld");
  assert(f.text() == "def");
  assert((f.cur() == Cursor{0, 0}));
  assert(f.vi.mode() == Mode::Normal);
  assert(f.vi.yank_register().text == "abc");
  Change span{Change::VisualSpan, 1, Operator::Delete};
  span.length = 3;
  assert(f.vi.last_change() == span);
  f.keys(".");
  assert(f.text().empty());

  Fixture lines("hello\nworld");
  lines.keys("vjd");
  assert(lines.text() == "orld");

  Fixture c("abc");
  c.keys("vlc");
  assert(c.text() == "c");
  assert(c.vi.mode() == Mode::Insert);

  Fixture x("abc");
  x.keys("vlx");
  assert(x.text() == "c");

  Fixture back("abc def");
  back.area.move_cursor({0, 4});
  back.keys("vby");
  assert(back.vi.yank_register().text == "abc d");
  assert((back.cur() == Cursor{0, 0}));

  Fixture leave("abc");
  leave.keys("vl");
  assert(leave.esc());
  assert(leave.vi.mode() == Mode::Normal);
  assert((leave.cur() == Cursor{0, 0}));
  assert(leave.area.selection().empty());
  leave.keys("vv");
  assert(leave.vi.mode() == Mode::Normal);
  leave.keys("vq");
  assert(leave.vi.mode() == Mode::Visual);
  assert(leave.text() == "abc");
}

static void test_undo_redo() {
  Fixture f("one two three");
  f.keys("d2w");
  assert(f.text() == "three");
  f.keys("u");
  assert(f.text() == "one two three");
  assert(!f.area.can_undo());
  assert(f.press(ControlKey::CtrlR));
  assert(f.text() == "three");

  Fixture g("abcdef");
  g.keys("xxx");
  assert(g.text() == "def");
  g.keys("2u");
  assert(g.text() == "bcdef");
  f.press(ControlKey::CtrlR);
  g.press(ControlKey::CtrlR);
  assert(g.text() == "cdef");
  g.keys("2u");
  assert(g.text() == "abcdef");
  g.keys("3");
  assert(g.press(ControlKey::CtrlR));
  assert(g.text() == "def");
  assert(g.idle());
}

static void test_mode_events() {
  Fixture f("ab", start_in(Mode::Insert));
  std::vector<Mode> seen;
  int extra = 0;
  f.vi.set_mode_changed_callback([&](Mode m) { seen.push_back(m); });
  int id = f.vi.mode_events().subscribe([&](Mode) { extra++; });

  assert(f.vi.mode() == Mode::Insert);
  assert(!f.vi.handle_key(KeyEvent::glyph('x')));
  assert(!f.press(ControlKey::Enter));
  assert(!f.press(ControlKey::Backspace));
  assert(f.esc());
  assert(f.esc());
  f.keys("i");
  f.vi.mode_events().unsubscribe(id);
  f.esc();
  assert((seen == std::vector<Mode>{Mode::Normal, Mode::Insert, Mode::Normal}));
  assert(extra == 2);

  // the string-keyed entry point used by widget toolkits
  assert(f.vi.handle_key("character", 'v'));
  assert(f.vi.mode() == Mode::Visual);
  assert(f.vi.handle_key("escape", std::nullopt));
  assert(f.vi.mode() == Mode::Normal);
  assert(f.vi.handle_key("f1", std::nullopt));
}

static void test_enable_toggle() {
  Fixture f("abc");
  int changes = 0;
  f.vi.set_mode_changed_callback([&](Mode) { changes++; });
  f.keys("2d");
  f.vi.set_enabled(false);
  assert(!f.vi.enabled());
  assert(f.vi.mode() == Mode::Insert);
  assert(f.idle());
  assert(changes == 1);
  assert(!f.vi.handle_key(KeyEvent::glyph('x')));
  assert(!f.esc());
  assert(f.vi.mode() == Mode::Insert);
  f.vi.set_enabled(true);
  assert(f.vi.mode() == Mode::Normal);

  f.keys("vl");
  f.vi.set_enabled(false);
  assert((f.cur() == Cursor{0, 0}));
  assert(f.area.selection().empty());

  ViOptions off = start_in(Mode::Normal);
  off.vi_enabled = false;
  Fixture g("abc", off);
  assert(!g.vi.enabled());
  assert(g.vi.mode() == Mode::Insert);
  g.vi.apply_options(start_in(Mode::Normal));
  assert(g.vi.enabled());
  assert(g.vi.mode() == Mode::Normal);
}

int main() {
  test_delete_word_then_counted_x();
  test_visual_yank();
  test_append_then_escape();
  test_counted_motion();
  test_dd_and_undo();
  test_yank_line_and_paste();
  test_empty_line_yank_replaces_register();
  test_charwise_paste();
  test_pending_always_clears();
  test_repeat();
  test_operator_motions();
  test_single_key_edits();
  test_insert_entries();
  test_goto_lines();
  test_visual_edits();
  test_undo_redo();
  test_mode_events();
  test_enable_toggle();
  return 0;
}
