#include <glog/logging.h>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include "input_session.hpp"
#include "ncurses_terminal.hpp"
#include "options.hpp"
#include "terminal.hpp"
#include "text_buffer.hpp"

static void usage(const char* prog) {
  std::cerr << "usage: " << prog << " [--rc PATH] [FILE]\n"
            << "  Ctrl-D submit, Ctrl-C abort, Ctrl-V toggle vi keys\n";
}

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  std::optional<std::filesystem::path> rc;
  std::optional<std::filesystem::path> path;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--rc") {
      if (i + 1 >= argc) { usage(argv[0]); return 2; }
      rc = std::filesystem::path(argv[++i]);
    } else if (a == "-h" || a == "--help") {
      usage(argv[0]);
      return 0;
    } else if (!a.empty() && a[0] == '-') {
      usage(argv[0]);
      return 2;
    } else {
      path = std::filesystem::path(a);
    }
  }

  ViOptions opts;
  OptionLoader loader(opts);
  std::string message;
  std::filesystem::path rc_path = rc ? *rc : default_rc_path();
  if (!rc_path.empty() && !loader.load_file(rc_path, message)) {
    LOG(WARNING) << "rc: " << message;
  }

  std::string initial;
  if (path) {
    std::string msg;
    bool ok = false;
    TextBuffer b = TextBuffer::from_file(*path, msg, ok);
    if (!ok) {
      std::cerr << msg << "\n";
      return 2;
    }
    initial = b.text();
  }

  InputSession::Outcome outcome;
  std::string text;
  {
    Terminal term;
    NcursesTerminal nterm;
    InputSession session(nterm, opts);
    session.set_text(initial);
    session.set_message(message);
    outcome = session.run();
    text = session.text();
  }
  if (outcome == InputSession::Outcome::Aborted) return 1;
  std::cout << text << "\n";
  return 0;
}
