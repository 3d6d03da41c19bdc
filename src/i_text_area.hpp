#pragma once
/*
 * ITextArea
 *
 * Purpose: the narrow text-widget contract the vi engine drives
 *          (cursor, selection, primitive motions/mutations, undo/redo).
 * Goal: keep the engine independent of any concrete buffer or UI toolkit.
 * Boundaries: every primitive clamps on its own; callers add no bounds logic.
 */
#include <string>
#include "types.hpp"

class ITextArea {
public:
  virtual ~ITextArea() = default;

  virtual Cursor cursor_location() const = 0;
  virtual void move_cursor(Cursor pos) = 0;
  virtual int line_count() const = 0;
  virtual std::string document_line(int row) const = 0;
  virtual Cursor document_end() const = 0;
  virtual std::string full_text() const = 0;
  virtual std::string text_range(Cursor start, Cursor end) const = 0;

  virtual void cursor_left() = 0;
  virtual void cursor_right() = 0;
  virtual void cursor_up() = 0;
  virtual void cursor_down() = 0;
  virtual void cursor_word_left() = 0;
  virtual void cursor_word_right() = 0;
  virtual void cursor_line_start() = 0;
  virtual void cursor_line_end() = 0;

  virtual void delete_left() = 0;
  virtual void delete_right() = 0;
  virtual void delete_to_end_of_line() = 0;
  virtual void insert(const std::string& text) = 0;
  virtual void remove(Cursor start, Cursor end) = 0;

  virtual Selection selection() const = 0;
  virtual void set_selection(const Selection& sel) = 0;
  virtual std::string selected_text() const = 0;

  virtual void undo() = 0;
  virtual void redo() = 0;
  // nestable; edits between the outermost pair undo as one step
  virtual void begin_group() = 0;
  virtual void commit_group() = 0;
};
