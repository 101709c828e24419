#include "util/Diag.hpp"
#include <cstdio>

namespace netsnap::util {

static bool g_verbose = false;

void set_verbose(bool on) { g_verbose = on; }

void diag(const char* component, const std::string& message) {
  if (!g_verbose) return;
  std::fprintf(stderr, "netsnap: %s: %s\n", component, message.c_str());
}

} // namespace netsnap::util
