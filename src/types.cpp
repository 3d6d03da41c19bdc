#include "types.hpp"

std::string_view mode_label(Mode m) {
  switch (m) {
    case Mode::Insert: return "INSERT";
    case Mode::Normal: return "NORMAL";
    case Mode::Visual: return "VISUAL";
  }
  return "";
}
