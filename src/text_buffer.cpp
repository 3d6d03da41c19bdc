#include "text_buffer.hpp"
#include <algorithm>
#include <utility>
#include "file_reader.hpp"

TextBuffer::TextBuffer() { ensure_not_empty(); }

bool TextBuffer::empty() const { return lines_.size() == 1 && lines_[0].empty(); }
int TextBuffer::line_count() const { return static_cast<int>(lines_.size()); }

std::string TextBuffer::line(int r) const {
  if (r < 0 || r >= line_count()) return std::string();
  return lines_[static_cast<size_t>(r)];
}

int TextBuffer::line_length(int r) const {
  if (r < 0 || r >= line_count()) return 0;
  return static_cast<int>(lines_[static_cast<size_t>(r)].size());
}

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(const std::vector<std::string>& src) {
  lines_ = src;
  ensure_not_empty();
}

void TextBuffer::init_from_lines(std::vector<std::string>&& src) {
  lines_ = std::move(src);
  ensure_not_empty();
}

void TextBuffer::init_from_text(const std::string& text) { init_from_lines(split_lines(text)); }

void TextBuffer::insert_line(int row, const std::string& s) {
  size_t pos = std::min(static_cast<size_t>(std::max(0, row)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), s);
}

void TextBuffer::insert_lines(int row, const std::vector<std::string>& ss) {
  size_t pos = std::min(static_cast<size_t>(std::max(0, row)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), ss.begin(), ss.end());
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::erase_lines(int start_row, int end_row) {
  start_row = std::clamp(start_row, 0, line_count());
  end_row = std::clamp(end_row, start_row, line_count());
  lines_.erase(lines_.begin() + start_row, lines_.begin() + end_row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

Cursor TextBuffer::clamp(Cursor c) const {
  c.row = std::clamp(c.row, 0, line_count() - 1);
  c.col = std::clamp(c.col, 0, line_length(c.row));
  return c;
}

Cursor TextBuffer::end() const {
  int last = line_count() - 1;
  return {last, line_length(last)};
}

std::string TextBuffer::text() const {
  std::string out;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i > 0) out += '\n';
    out += lines_[i];
  }
  return out;
}

std::string TextBuffer::text_range(Cursor start, Cursor end) const {
  start = clamp(start); end = clamp(end);
  if (end < start) std::swap(start, end);
  const std::string& first = lines_[static_cast<size_t>(start.row)];
  if (start.row == end.row) return first.substr(start.col, end.col - start.col);
  std::string out = first.substr(start.col);
  for (int r = start.row + 1; r < end.row; ++r) {
    out += '\n';
    out += lines_[static_cast<size_t>(r)];
  }
  out += '\n';
  out += lines_[static_cast<size_t>(end.row)].substr(0, end.col);
  return out;
}

Cursor TextBuffer::insert_text(Cursor at, const std::string& s) {
  at = clamp(at);
  std::vector<std::string> parts = split_lines(s);
  std::string& target = lines_[static_cast<size_t>(at.row)];
  std::string right = target.substr(at.col);
  target.erase(at.col);
  if (parts.size() == 1) {
    target += parts[0];
    int col = static_cast<int>(target.size());
    target += right;
    return {at.row, col};
  }
  target += parts[0];
  std::vector<std::string> tail(parts.begin() + 1, parts.end());
  int last_row = at.row + static_cast<int>(tail.size());
  int last_col = static_cast<int>(tail.back().size());
  tail.back() += right;
  insert_lines(at.row + 1, tail);
  return {last_row, last_col};
}

std::string TextBuffer::erase_range(Cursor start, Cursor end) {
  start = clamp(start); end = clamp(end);
  if (end < start) std::swap(start, end);
  std::string removed = text_range(start, end);
  if (start == end) return removed;
  std::string left = lines_[static_cast<size_t>(start.row)].substr(0, start.col);
  std::string right = lines_[static_cast<size_t>(end.row)].substr(end.col);
  if (end.row > start.row) erase_lines(start.row + 1, end.row + 1);
  lines_[static_cast<size_t>(start.row)] = left + right;
  return removed;
}

std::vector<std::string> TextBuffer::split_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(text.substr(st)); break; }
    lines.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  std::vector<std::string> ls;
  ok = mmap_readlines(path, ls, msg);
  if (ok) b.init_from_lines(std::move(ls));
  return b;
}
