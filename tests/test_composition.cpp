#include "composition.hpp"
#include <cassert>

int main() {
  Composition c;
  assert(c.empty());
  assert(c.count_value(100) == 1);
  assert(!c.consume_digit('0'));
  assert(c.consume_digit('1'));
  assert(c.consume_digit('0'));
  assert(!c.consume_digit('x'));
  assert(c.has_count());
  assert(c.count_value(100) == 10);
  assert(c.count_value(5) == 5);

  // saturates instead of overflowing
  for (int i = 0; i < 30; ++i) c.consume_digit('9');
  assert(c.count_value(9999) == 9999);

  c.op = Operator::Delete;
  c.awaited = CharSearch::TillForward;
  assert(!c.empty());
  c.count = "2";
  assert(c.keys() == "2dt");
  c.clear();
  assert(c.empty());
  assert(c == Composition{});

  c.second_g = true;
  assert(c.keys() == "g");
  c.clear();
  assert(c.keys().empty());
  return 0;
}
