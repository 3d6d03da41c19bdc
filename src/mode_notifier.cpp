#include "mode_notifier.hpp"
#include <utility>

void ModeNotifier::set_callback(Handler h) {
  if (h) handlers_[0] = std::move(h);
  else handlers_.erase(0);
}

int ModeNotifier::subscribe(Handler h) {
  int id = next_id_++;
  handlers_[id] = std::move(h);
  return id;
}

void ModeNotifier::unsubscribe(int id) { handlers_.erase(id); }

void ModeNotifier::emit(Mode m) const {
  // handlers may (un)subscribe while being called
  auto snapshot = handlers_;
  for (const auto& entry : snapshot) {
    if (entry.second) entry.second(m);
  }
}
