#include "undo_manager.hpp"

void UndoManager::begin_group(const Cursor& pre) {
  if (!grouping_) {
    grouping_ = true;
    current_.ops.clear();
    current_.pre = pre;
  }
}

void UndoManager::push_op(const Operation& op) {
  if (grouping_) {
    current_.ops.push_back(op);
  }
}

void UndoManager::commit_group(const Cursor& post) {
  if (grouping_) {
    grouping_ = false;
    current_.post = post;
    if (!current_.ops.empty()) {
      undo_entries_.push_back(current_);
      redo_entries_.clear();
    }
    current_.ops.clear();
  }
}

bool UndoManager::can_undo() const { return !undo_entries_.empty(); }
bool UndoManager::can_redo() const { return !redo_entries_.empty(); }

bool UndoManager::undo(TextBuffer& buf, Cursor& cur) {
  if (undo_entries_.empty()) return false;
  UndoEntry e = undo_entries_.back();
  undo_entries_.pop_back();
  for (int i = static_cast<int>(e.ops.size()) - 1; i >= 0; --i) {
    const Operation& op = e.ops[static_cast<size_t>(i)];
    switch (op.type) {
      case Operation::InsertText: buf.erase_range(op.at, op.end); break;
      case Operation::DeleteText: buf.insert_text(op.at, op.payload); break;
    }
  }
  cur = buf.clamp(e.pre);
  redo_entries_.push_back(e);
  return true;
}

bool UndoManager::redo(TextBuffer& buf, Cursor& cur) {
  if (redo_entries_.empty()) return false;
  UndoEntry e = redo_entries_.back();
  redo_entries_.pop_back();
  for (const Operation& op : e.ops) {
    switch (op.type) {
      case Operation::InsertText: buf.insert_text(op.at, op.payload); break;
      case Operation::DeleteText: buf.erase_range(op.at, op.end); break;
    }
  }
  cur = buf.clamp(e.post);
  undo_entries_.push_back(e);
  return true;
}
