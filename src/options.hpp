#pragma once
/*
 * Options
 *
 * Purpose: runtime settings of the vi engine and their rc-file loader.
 * Format: one `set <name>[=value]` or `set <name> <value>` per line;
 *         '#' and '"' start comments, a leading ':' is accepted.
 * Errors: bool + message, bad lines are skipped and loading continues.
 */
#include <filesystem>
#include <string>
#include "config.hpp"
#include "types.hpp"
#include "option_registry.hpp"

struct ViOptions {
  bool vi_enabled = true;
  Mode start_mode = Mode::Insert;
  int max_count = VINPUT_MAX_COUNT;
};

class OptionLoader {
public:
  explicit OptionLoader(ViOptions& opts);
  bool apply_line(const std::string& line, std::string& msg);
  bool load_file(const std::filesystem::path& path, std::string& msg);

private:
  void register_options();
  ViOptions& opts_;
  OptionRegistry registry_;
};

// $HOME/VINPUT_RC_NAME, empty when HOME is unset
std::filesystem::path default_rc_path();
