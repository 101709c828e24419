#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace netsnap::util {

// Strip leading/trailing ASCII whitespace (including '\r').
[[nodiscard]] std::string_view trim(std::string_view sv);

// Split on runs of ASCII whitespace; never yields empty tokens.
[[nodiscard]] std::vector<std::string> split_ws(std::string_view sv);

// Split on '\n' only; a trailing newline does not produce an extra empty line.
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view sv);

// True when sv starts with four dot-separated digit runs (e.g. "10.0.0.0", "192.168.1.0/24").
[[nodiscard]] bool has_dotted_quad_prefix(std::string_view sv);

// Replace every invalid UTF-8 sequence with U+FFFD.
[[nodiscard]] std::string sanitize_utf8(std::string_view in);

// First non-blank line, trimmed. Empty if none.
[[nodiscard]] std::string first_line(std::string_view sv);

inline char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

} // namespace netsnap::util
