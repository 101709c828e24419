#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include "util/Text.hpp"

namespace netsnap::util {

// Read-only subset of TOML: [section] headers, key = value pairs, quoted or
// bare values, '#' comments. Enough for the config file, nothing more.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { entries_.clear(); return false; }
    parse(in);
    return true;
  }

  void load_string(std::string_view text) {
    std::istringstream in{std::string(text)};
    parse(in);
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    int out = def;
    const char* first = v->data();
    const char* last = first + v->size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    std::string s;
    for (char c : *v) s.push_back(ascii_lower(static_cast<unsigned char>(c)));
    if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

private:
  struct Entry { std::string section, key, value; };
  std::vector<Entry> entries_;

  void parse(std::istream& in) {
    entries_.clear();
    std::string current;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto val = trim(sv.substr(eq + 1));
      std::string value;
      if (!val.empty() && val.front() == '"') {
        auto close = val.find('"', 1);
        value = std::string(val.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1));
      } else {
        auto hash = val.find('#');
        value = std::string(trim(val.substr(0, hash)));
      }
      set(current, key, value);
    }
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = value; return; }
    }
    entries_.push_back({section, key, value});
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return &e.value;
    return nullptr;
  }
};

} // namespace netsnap::util
