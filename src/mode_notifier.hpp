#pragma once
/*
 * ModeNotifier
 *
 * Purpose: mode-change event the host subscribes to (e.g. a mode label).
 * Design: id → handler; slot 0 is the single "mode changed" callback,
 *         further listeners subscribe/unsubscribe by id.
 */
#include <functional>
#include <map>
#include "types.hpp"

class ModeNotifier {
public:
  using Handler = std::function<void(Mode)>;

  void set_callback(Handler h);
  int subscribe(Handler h);
  void unsubscribe(int id);
  void emit(Mode m) const;

private:
  std::map<int, Handler> handlers_;
  int next_id_ = 1;
};
