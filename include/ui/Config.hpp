#pragma once

#include <string>

namespace tessera::ui {

// Engine settings, resolved per key as config file -> environment -> default.
struct EngineConfig {
  // [terminal]
  bool alt_screen{true};
  bool hide_cursor{true};
  // [pool]
  int pool_initial{5};
  int pool_max{50};
  // [profile]
  bool profile_enabled{false};
  std::string profile_output;
  int profile_max_frames{300};
  bool profile_node_count{false};
  // [errors]
  std::string error_log;
  // [loop]
  int poll_ms{16};
};

// Reads TESSERA_FOO, falling back to tessera_foo. Empty values count as unset.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/tessera/config.toml, else ~/.config/tessera/config.toml;
// empty when neither variable is set.
std::string config_file_path();

// Resolves against an explicit file; a missing or empty path leaves the
// environment and defaults.
EngineConfig load_config(const std::string& path);

// Process config from config_file_path(), loaded once.
const EngineConfig& config();

} // namespace tessera::ui
