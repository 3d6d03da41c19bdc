#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text storage with line ops and position-addressed
 *          text ops (insert/erase/read a span between two cursors).
 * Invariant: always holds at least one (possibly empty) line.
 * Note: no cursor/selection here; TextArea layers those on top.
 */
#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();

  bool empty() const;
  int line_count() const;
  std::string line(int r) const;
  int line_length(int r) const;
  void ensure_not_empty();

  void init_from_lines(const std::vector<std::string>& lines);
  void init_from_lines(std::vector<std::string>&& lines);
  void init_from_text(const std::string& text);

  void insert_line(int row, const std::string& s);
  void insert_lines(int row, const std::vector<std::string>& ss);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row);
  void replace_line(int row, const std::string& s);

  Cursor clamp(Cursor c) const;
  Cursor end() const;
  std::string text() const;
  std::string text_range(Cursor start, Cursor end) const;
  // returns the position just past the inserted text
  Cursor insert_text(Cursor at, const std::string& s);
  // returns the removed text; start/end may come in either order
  std::string erase_range(Cursor start, Cursor end);

  static std::vector<std::string> split_lines(const std::string& text);
  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);

private:
  std::vector<std::string> lines_;
};
