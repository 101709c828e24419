#include "ui/Terminal.hpp"
#ifdef _WIN32
#include <io.h>
#include <cstdio>
#else
#include <unistd.h>
#endif

namespace netsnap::ui {

static bool g_color = false;

bool tty_stdout() {
#ifdef _WIN32
  return ::_isatty(::_fileno(stdout)) != 0;
#else
  return ::isatty(STDOUT_FILENO) == 1;
#endif
}

void set_color_enabled(bool on) { g_color = on; }
bool color_enabled() { return g_color; }

std::string sgr(const char* code) {
  if (!g_color) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() { return sgr("0"); }
std::string sgr_bold()  { return sgr("1"); }
std::string sgr_accent(){ return sgr("96"); } // bright cyan

} // namespace netsnap::ui
