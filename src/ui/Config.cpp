#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <string>

namespace hostsnap::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HOSTSNAP_", 0) == 0) {
    alt = std::string("hostsnap_") + n.substr(9);
  } else if (n.rfind("hostsnap_", 0) == 0) {
    alt = std::string("HOSTSNAP_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/hostsnap/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/hostsnap/config.toml";
  return {};
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) c.source = path;

  // --- [log] ---
  c.verbose = resolve_bool(toml, have_toml, "log", "verbose", "HOSTSNAP_VERBOSE", false);
  return c;
}

const Config& config() {
  static const Config cfg = load_config(config_file_path());
  return cfg;
}

} // namespace hostsnap::ui
