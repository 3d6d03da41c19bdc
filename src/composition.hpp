#pragma once
/*
 * Composition
 *
 * Purpose: pending state of a Normal mode command being typed
 *          (count digits, operator, awaited character, second 'g').
 * Rule: cleared as a whole once the command completes, no-ops or cancels.
 */
#include <optional>
#include <string>
#include "motion.hpp"
#include "operator_exec.hpp"

struct Composition {
  std::optional<Operator> op;
  std::string count;
  std::optional<CharSearch> awaited;
  bool second_g = false;

  // '1'-'9' always extend the count, '0' only once a count has started
  bool consume_digit(char c);
  bool has_count() const { return !count.empty(); }
  // 1 when no count was typed; saturates at max
  int count_value(int max) const;
  void clear();
  bool empty() const;
  // the keys typed so far, for a status line ("2d", "f", "g")
  std::string keys() const;
  bool operator==(const Composition&) const = default;
};
