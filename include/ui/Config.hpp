#pragma once

#include <string>

namespace hostsnap::ui {

struct Config {
  bool verbose{false};      // diagnostics on stderr
  std::string source;       // config file actually read, empty if none
};

// Resolved once from TOML -> env -> compiled default
const Config& config();

// Same resolution against an explicit file; a missing file is not an error
Config load_config(const std::string& path);

// $XDG_CONFIG_HOME/hostsnap/config.toml or ~/.config/hostsnap/config.toml
std::string config_file_path();

// Environment variable helpers (HOSTSNAP_X and hostsnap_X are equivalent)
const char* getenv_compat(const char* name);
bool env_flag(const char* name, bool defv);

} // namespace hostsnap::ui
