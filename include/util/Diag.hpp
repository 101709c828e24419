// stderr diagnostics: "netsnap: <component>: <message>", off unless verbose
#pragma once
#include <string>

namespace netsnap::util {

void set_verbose(bool on);

// Emit one diagnostic line when verbose output is enabled.
void diag(const char* component, const std::string& message);

} // namespace netsnap::util
