#include "composition.hpp"

bool Composition::consume_digit(char c) {
  if (c >= '1' && c <= '9') { count.push_back(c); return true; }
  if (c == '0' && !count.empty()) { count.push_back(c); return true; }
  return false;
}

int Composition::count_value(int max) const {
  if (count.empty()) return 1;
  if (max < 1) max = 1;
  long long v = 0;
  for (char c : count) {
    v = v * 10 + (c - '0');
    if (v >= max) return max;
  }
  return static_cast<int>(v);
}

void Composition::clear() {
  op.reset();
  count.clear();
  awaited.reset();
  second_g = false;
}

bool Composition::empty() const {
  return !op && count.empty() && !awaited && !second_g;
}

std::string Composition::keys() const {
  std::string out = count;
  if (op) {
    switch (*op) {
      case Operator::Delete: out.push_back('d'); break;
      case Operator::Change: out.push_back('c'); break;
      case Operator::Yank: out.push_back('y'); break;
    }
  }
  if (awaited) {
    switch (*awaited) {
      case CharSearch::FindForward: out.push_back('f'); break;
      case CharSearch::TillForward: out.push_back('t'); break;
      case CharSearch::FindBackward: out.push_back('F'); break;
      case CharSearch::TillBackward: out.push_back('T'); break;
      case CharSearch::ReplaceOne: out.push_back('r'); break;
    }
  }
  if (second_g) out.push_back('g');
  return out;
}
