#pragma once
/*
 * TextArea
 *
 * Purpose: reference ITextArea over TextBuffer + UndoManager, behaving like
 *          a typical multi-line input widget (cursor may sit past the last
 *          glyph, left/right wrap across lines, delete joins lines).
 * Note: the cursor is the active end of the selection.
 */
#include <string>
#include "i_text_area.hpp"
#include "text_buffer.hpp"
#include "undo_manager.hpp"

class TextArea : public ITextArea {
public:
  TextArea() = default;
  explicit TextArea(const std::string& text);

  // replaces the content, resets cursor and undo history
  void set_text(const std::string& text);
  const TextBuffer& buffer() const { return buf_; }
  bool can_undo() const { return um_.can_undo(); }
  bool can_redo() const { return um_.can_redo(); }

  Cursor cursor_location() const override { return sel_.active; }
  void move_cursor(Cursor pos) override;
  int line_count() const override { return buf_.line_count(); }
  std::string document_line(int row) const override { return buf_.line(row); }
  Cursor document_end() const override { return buf_.end(); }
  std::string full_text() const override { return buf_.text(); }
  std::string text_range(Cursor start, Cursor end) const override { return buf_.text_range(start, end); }

  void cursor_left() override;
  void cursor_right() override;
  void cursor_up() override;
  void cursor_down() override;
  void cursor_word_left() override;
  void cursor_word_right() override;
  void cursor_line_start() override;
  void cursor_line_end() override;

  void delete_left() override;
  void delete_right() override;
  void delete_to_end_of_line() override;
  void insert(const std::string& text) override;
  void remove(Cursor start, Cursor end) override;

  Selection selection() const override { return sel_; }
  void set_selection(const Selection& sel) override;
  std::string selected_text() const override;

  void undo() override;
  void redo() override;
  void begin_group() override;
  void commit_group() override;

private:
  TextBuffer buf_;
  UndoManager um_;
  Selection sel_;
  int group_depth_ = 0;
};
