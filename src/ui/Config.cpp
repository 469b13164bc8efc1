#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>

namespace tessera::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("TESSERA_", 0) == 0) {
    alt = std::string("tessera_") + n.substr(8);
  } else if (n.rfind("tessera_", 0) == 0) {
    alt = std::string("TESSERA_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  const char* end = v + std::strlen(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(v, end, out);
  if (ec != std::errc{} || ptr != end) return defv;
  return out;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tessera/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tessera/config.toml";
  return {};
}

namespace {

// Resolve an int from TOML -> env -> compiled default
int resolve_int(const util::TomlReader& toml, bool have_toml,
                const char* section, const char* key,
                const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  return getenv_int(env_name, def);
}

// Resolve a bool from TOML -> env -> compiled default
bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                  const char* section, const char* key,
                  const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  return env_flag(env_name, def);
}

// Resolve a string from TOML -> env -> compiled default
std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                           const char* section, const char* key,
                           const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  const char* v = getenv_compat(env_name);
  if (v && *v) return std::string(v);
  return def;
}

} // namespace

EngineConfig load_config(const std::string& path) {
  EngineConfig c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [terminal] ---
  c.alt_screen  = resolve_bool(toml, have_toml, "terminal", "alt_screen",  "TESSERA_ALT_SCREEN", true);
  c.hide_cursor = resolve_bool(toml, have_toml, "terminal", "hide_cursor", "TESSERA_HIDE_CURSOR", true);

  // --- [pool] ---
  c.pool_initial = resolve_int(toml, have_toml, "pool", "initial_size", "TESSERA_POOL_INITIAL", 5);
  c.pool_max     = resolve_int(toml, have_toml, "pool", "max_size",     "TESSERA_POOL_MAX", 50);
  c.pool_max     = std::max(1, c.pool_max);
  c.pool_initial = std::clamp(c.pool_initial, 0, c.pool_max);

  // --- [profile] ---
  c.profile_enabled    = resolve_bool(toml, have_toml, "profile", "enabled",      "TESSERA_PROFILE", false);
  c.profile_output     = resolve_string(toml, have_toml, "profile", "output",     "TESSERA_PROFILE_OUTPUT", "");
  c.profile_max_frames = resolve_int(toml, have_toml, "profile", "max_frames",    "TESSERA_PROFILE_MAX_FRAMES", 300);
  c.profile_max_frames = std::max(1, c.profile_max_frames);
  c.profile_node_count = resolve_bool(toml, have_toml, "profile", "node_count",   "TESSERA_PROFILE_NODE_COUNT", false);

  // --- [errors] ---
  c.error_log = resolve_string(toml, have_toml, "errors", "log", "TESSERA_ERROR_LOG", "");

  // --- [loop] ---
  c.poll_ms = std::clamp(resolve_int(toml, have_toml, "loop", "poll_ms", "TESSERA_POLL_MS", 16), 1, 1000);

  return c;
}

const EngineConfig& config() {
  static EngineConfig cfg = load_config(config_file_path());
  return cfg;
}

} // namespace tessera::ui
