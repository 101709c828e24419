#pragma once
#include <string_view>

namespace netsnap::util {

// Operating system family, detected once at startup.
enum class Platform { Windows, Linux, Darwin, Other };

// Map a kernel name as reported by uname(2) ("Linux", "Darwin", ...) to a Platform.
[[nodiscard]] Platform parse_platform(std::string_view sysname);

// Detect the running OS. Windows is decided at compile time, everything else via uname(2).
[[nodiscard]] Platform detect_platform();

[[nodiscard]] const char* platform_name(Platform p);

} // namespace netsnap::util
