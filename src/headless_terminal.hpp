#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests: a character grid that
 *          records highlighted cells, plus a scripted input queue.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  std::optional<InputEvent> read_event() override;

  // scripting
  void push_key(const KeyEvent& k) { input_.push_back({InputEvent::Key, k}); }
  void push_keys(const std::string& glyphs);
  void push_event(InputEvent::Kind kind) { input_.push_back({kind, KeyEvent::control(ControlKey::Other)}); }

  // inspection; rows are right-trimmed
  std::string row_text(int row) const;
  std::string highlighted(int row) const;
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, char c, bool hl);

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<bool>> hl_;
  std::deque<InputEvent> input_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
};
