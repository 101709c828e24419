#include "util/Text.hpp"
#include <cctype>

namespace netsnap::util {

static bool is_ws(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && is_ws(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back())) sv.remove_suffix(1);
  return sv;
}

std::vector<std::string> split_ws(std::string_view sv) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && is_ws(sv[i])) ++i;
    size_t start = i;
    while (i < sv.size() && !is_ws(sv[i])) ++i;
    if (i > start) out.emplace_back(sv.substr(start, i - start));
  }
  return out;
}

std::vector<std::string_view> split_lines(std::string_view sv) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (start < sv.size()) {
    size_t nl = sv.find('\n', start);
    if (nl == std::string_view::npos) { out.push_back(sv.substr(start)); break; }
    out.push_back(sv.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

bool has_dotted_quad_prefix(std::string_view sv) {
  size_t i = 0;
  for (int group = 0; group < 4; ++group) {
    if (group > 0) {
      if (i >= sv.size() || sv[i] != '.') return false;
      ++i;
    }
    size_t start = i;
    while (i < sv.size() && is_digit(sv[i])) ++i;
    if (i == start) return false;
  }
  return true;
}

std::string sanitize_utf8(std::string_view in) {
  static constexpr const char* kReplacement = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    auto c = static_cast<unsigned char>(in[i]);
    if (c < 0x80) { out.push_back(static_cast<char>(c)); ++i; continue; }
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF; // allowed range for the second byte
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c == 0xE0) { len = 3; lo = 0xA0; }
    else if (c >= 0xE1 && c <= 0xEC) len = 3;
    else if (c == 0xED) { len = 3; hi = 0x9F; }
    else if (c >= 0xEE && c <= 0xEF) len = 3;
    else if (c == 0xF0) { len = 4; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) len = 4;
    else if (c == 0xF4) { len = 4; hi = 0x8F; }
    if (len == 0) { out += kReplacement; ++i; continue; }
    // Consume the longest valid prefix; a broken sequence becomes one replacement.
    size_t j = 1;
    for (; j < len && i + j < in.size(); ++j) {
      auto cc = static_cast<unsigned char>(in[i + j]);
      unsigned char l = (j == 1) ? lo : 0x80;
      unsigned char h = (j == 1) ? hi : 0xBF;
      if (cc < l || cc > h) break;
    }
    if (j == len) out.append(in.substr(i, len));
    else out += kReplacement;
    i += j;
  }
  return out;
}

std::string first_line(std::string_view sv) {
  for (auto line : split_lines(sv)) {
    auto t = trim(line);
    if (!t.empty()) return std::string(t);
  }
  return {};
}

} // namespace netsnap::util
