#pragma once

#include <string>

namespace netsnap::ui {

// Terminal capability detection
[[nodiscard]] bool tty_stdout();

// SGR code generation; every helper returns "" when color is off.
void set_color_enabled(bool on);
[[nodiscard]] bool color_enabled();
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_accent();

} // namespace netsnap::ui
