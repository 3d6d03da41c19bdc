#pragma once
/*
 * Character classes for word motions: spaces, word chars (alnum + '_'),
 * and symbols (everything else). A word is a run of one class.
 */
#include <cctype>

static inline bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}
static inline bool is_word(unsigned char c) {
  return std::isalnum(c) != 0 || c == '_';
}
static inline bool is_symbol(unsigned char c) {
  return !is_space(c) && !is_word(c);
}
static inline bool same_class(unsigned char a, unsigned char b) {
  return (is_word(a) && is_word(b)) || (is_symbol(a) && is_symbol(b));
}
