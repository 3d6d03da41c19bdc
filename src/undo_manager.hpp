#pragma once
/*
 * UndoManager
 *
 * Purpose: grouped undo/redo of text edits against a TextBuffer.
 * Model: an entry is a list of span insertions/removals plus the cursor
 *        before (restored on undo) and after (restored on redo) the group.
 */
#include <vector>
#include <string>
#include "types.hpp"
#include "text_buffer.hpp"

struct Operation {
  enum Type { InsertText, DeleteText } type;
  Cursor at;        // start of the span
  Cursor end;       // end of the span as it stood after an insert / before a delete
  std::string payload;
};

struct UndoEntry {
  std::vector<Operation> ops;
  Cursor pre;
  Cursor post;
};

class UndoManager {
public:
  void begin_group(const Cursor& pre);
  void push_op(const Operation& op);
  void commit_group(const Cursor& post);
  bool grouping() const { return grouping_; }
  bool can_undo() const;
  bool can_redo() const;
  size_t undo_size() const { return undo_entries_.size(); }
  bool undo(TextBuffer& buf, Cursor& cur);
  bool redo(TextBuffer& buf, Cursor& cur);

private:
  std::vector<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  bool grouping_ = false;
  UndoEntry current_;
};
