#pragma once

#include <string>
#include "util/TomlReader.hpp"

namespace netsnap::ui {

struct Settings {
  int width{80};          // banner and centering width
  bool color{true};       // bold/accented banners when stdout is a TTY
  bool unicode{false};    // box-drawing table borders
  std::string resolv_conf{"/etc/resolv.conf"};
  bool verbose{false};    // stderr diagnostics
};

// $XDG_CONFIG_HOME/netsnap/config.toml or ~/.config/netsnap/config.toml; empty if neither is known.
std::string config_file_path();

// Resolve every key TOML -> env -> compiled default. toml may be null.
Settings resolve_settings(const netsnap::util::TomlReader* toml);

// Load the config file (if present) and resolve.
Settings load_settings();

// Environment helpers (NETSNAP_ prefix, lower-case netsnap_ accepted too)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace netsnap::ui
