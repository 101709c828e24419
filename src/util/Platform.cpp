#include "util/Platform.hpp"

#ifndef _WIN32
#include <sys/utsname.h>
#endif

namespace netsnap::util {

Platform parse_platform(std::string_view sysname) {
  if (sysname == "Windows") return Platform::Windows;
  if (sysname == "Linux") return Platform::Linux;
  if (sysname == "Darwin") return Platform::Darwin;
  return Platform::Other;
}

Platform detect_platform() {
#ifdef _WIN32
  return Platform::Windows;
#else
  struct utsname uts{};
  if (::uname(&uts) != 0) return Platform::Other;
  return parse_platform(uts.sysname);
#endif
}

const char* platform_name(Platform p) {
  switch (p) {
    case Platform::Windows: return "Windows";
    case Platform::Linux:   return "Linux";
    case Platform::Darwin:  return "Darwin";
    case Platform::Other:   return "Other";
  }
  return "Other";
}

} // namespace netsnap::util
