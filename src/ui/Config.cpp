#include "ui/Config.hpp"
#include "util/Text.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace netsnap::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // NETSNAP_RESOLV_CONF <-> netsnap_resolv_conf
  std::string alt;
  std::string n(name);
  if (n.rfind("NETSNAP_", 0) == 0) {
    for (char c : n) alt.push_back(netsnap::util::ascii_lower(static_cast<unsigned char>(c)));
  } else if (n.rfind("netsnap_", 0) == 0) {
    for (char c : n) alt.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (!alt.empty() && alt != n) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  if (sv.front() == '+') sv.remove_prefix(1);
  int out = defv;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/netsnap/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/netsnap/config.toml";
  return {};
}

static int resolve_int(const netsnap::util::TomlReader* toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (toml && toml->has(section, key))
    return toml->get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const netsnap::util::TomlReader* toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (toml && toml->has(section, key))
    return toml->get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const netsnap::util::TomlReader* toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (toml && toml->has(section, key))
    return toml->get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Settings resolve_settings(const netsnap::util::TomlReader* toml) {
  Settings s{};
  // --- [ui] ---
  s.width   = std::max(20, resolve_int(toml, "ui", "width", "NETSNAP_WIDTH", 80));
  s.color   = resolve_bool(toml, "ui", "color",   "NETSNAP_COLOR", true);
  s.unicode = resolve_bool(toml, "ui", "unicode", "NETSNAP_UNICODE", false);
  // --- [dns] ---
  s.resolv_conf = resolve_string(toml, "dns", "resolv_conf", "NETSNAP_RESOLV_CONF", "/etc/resolv.conf");
  // --- [log] ---
  s.verbose = resolve_bool(toml, "log", "verbose", "NETSNAP_VERBOSE", false);
  return s;
}

Settings load_settings() {
  netsnap::util::TomlReader toml;
  auto path = config_file_path();
  bool have_toml = !path.empty() && toml.load(path);
  return resolve_settings(have_toml ? &toml : nullptr);
}

} // namespace netsnap::ui
