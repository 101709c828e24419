#include "ui/Formatting.hpp"
#include <algorithm>

namespace netsnap::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string pad_right(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  return s + std::string(w - cols, ' ');
}

// Odd padding goes right, except when the width itself is odd.
std::string center(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  int fill = w - cols;
  int left = fill / 2 + (fill & w & 1);
  return std::string(left, ' ') + s + std::string(fill - left, ' ');
}

std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0, n * (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

} // namespace netsnap::ui
