#pragma once
/*
 * OptionRegistry
 *
 * Purpose: register and dispatch `set <name>` options.
 * Design: map name → handler (args vector, message out); handlers return
 *         false and fill the message when they reject a value.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <utility>
#include <vector>

class OptionRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_option(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown option: " + name; return false; }
    return it->second(args, msg);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
