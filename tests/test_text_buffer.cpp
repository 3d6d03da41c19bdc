#include "text_buffer.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  TextBuffer b;
  assert(b.line_count() == 1);
  assert(b.empty());
  b.init_from_lines({"a", "b", "c"});
  assert(b.line_count() == 3);
  b.insert_line(1, "x");
  assert(b.line_count() == 4);
  assert(b.line(1) == std::string("x"));
  b.erase_line(2);
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.line(1) == std::string("x"));
  assert(b.line(2) == std::string("c"));
  b.replace_line(2, "z");
  assert(b.line(2) == std::string("z"));
  b.erase_lines(1, 3);
  assert(b.line_count() == 1);
  assert(b.line(0) == std::string("a"));
  b.erase_line(0);
  assert(b.line_count() == 1 && b.line(0).empty());

  // positional ops
  b.init_from_text("hello\nworld");
  assert(b.text() == "hello\nworld");
  assert((b.end() == Cursor{1, 5}));
  assert((b.clamp({7, 9}) == Cursor{1, 5}));
  assert((b.clamp({-1, -4}) == Cursor{0, 0}));
  assert(b.text_range({0, 3}, {1, 2}) == "lo\nwo");
  assert(b.text_range({1, 2}, {0, 3}) == "lo\nwo");

  Cursor e = b.insert_text({0, 5}, ", big\nwide");
  assert((e == Cursor{1, 4}));
  assert(b.text() == "hello, big\nwide\nworld");

  std::string gone = b.erase_range({0, 5}, {1, 4});
  assert(gone == ", big\nwide");
  assert(b.text() == "hello\nworld");

  gone = b.erase_range({0, 5}, {1, 0});
  assert(gone == "\n");
  assert(b.text() == "helloworld");
  assert(b.line_count() == 1);

  std::vector<std::string> parts = TextBuffer::split_lines("a\n\nb\n");
  assert(parts.size() == 4);
  assert(parts[1].empty() && parts[3].empty());
  return 0;
}
