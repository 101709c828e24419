#pragma once

#include <string>

namespace netsnap::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);

// Text alignment
std::string pad_right(const std::string& s, int w);
std::string center(const std::string& s, int w);
std::string repeat_str(const std::string& ch, int n);

} // namespace netsnap::ui
