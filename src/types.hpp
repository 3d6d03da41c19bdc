#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Selection).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <compare>
#include <string_view>

enum class Mode { Insert, Normal, Visual };

std::string_view mode_label(Mode m);

struct Cursor {
  int row = 0;
  int col = 0;
  auto operator<=>(const Cursor&) const = default;
};

struct Selection {
  Cursor anchor;
  Cursor active;
  Cursor start() const { return anchor < active ? anchor : active; }
  Cursor end() const { return anchor < active ? active : anchor; }
  bool empty() const { return anchor == active; }
};
