#include "options.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <vector>
#include "file_reader.hpp"

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

OptionLoader::OptionLoader(ViOptions& opts) : opts_(opts) { register_options(); }

void OptionLoader::register_options() {
  registry_.register_option("set vimode", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) {
      opts_.vi_enabled = !opts_.vi_enabled;
    } else {
      std::string v = to_lower(args[0]);
      if (v == "on" || v == "1" || v == "true") opts_.vi_enabled = true;
      else if (v == "off" || v == "0" || v == "false") opts_.vi_enabled = false;
      else { msg = "set vimode: use :set vimode on|off"; return false; }
    }
    msg = opts_.vi_enabled ? "vimode on" : "vimode off";
    return true;
  });
  registry_.register_option("set startmode", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set startmode: use :set startmode insert|normal"; return false; }
    std::string v = to_lower(args[0]);
    if (v == "insert") opts_.start_mode = Mode::Insert;
    else if (v == "normal") opts_.start_mode = Mode::Normal;
    else { msg = "set startmode: mode must be insert|normal"; return false; }
    msg = "startmode=" + v;
    return true;
  });
  registry_.register_option("set maxcount", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set maxcount: use :set maxcount <n>"; return false; }
    const std::string& s = args[0];
    int n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || ptr != s.data() + s.size()) { msg = "set maxcount: value must be a number"; return false; }
    if (n < 1) { msg = "set maxcount: value must be >= 1"; return false; }
    opts_.max_count = n;
    msg = "maxcount=" + s;
    return true;
  });
}

bool OptionLoader::apply_line(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty() || s[0] == '#' || s[0] == '"') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set") { msg = "unknown command: " + cmd; return false; }
  if (args.empty()) { msg = "set: missing option name"; return false; }
  std::string name = args[0];
  std::vector<std::string> subargs;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    subargs.push_back(name.substr(eq + 1));
    name = name.substr(0, eq);
  }
  subargs.insert(subargs.end(), args.begin() + 1, args.end());
  return registry_.execute("set " + to_lower(name), subargs, msg);
}

bool OptionLoader::load_file(const std::filesystem::path& path, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) { msg = "no rc file: " + path.string(); return true; }
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  bool ok = true;
  int lineno = 0;
  for (const std::string& l : lines) {
    ++lineno;
    std::string m;
    if (!apply_line(l, m)) {
      LOG(WARNING) << path.string() << ":" << lineno << ": " << m;
      msg = m;
      ok = false;
    }
  }
  if (ok) msg = "loaded rc: " + path.string();
  return ok;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / VINPUT_RC_NAME;
}
