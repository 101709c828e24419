#include "util/Procfs.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>

namespace netsnap::util {

static std::string proc_root() {
  const char* env = std::getenv("NETSNAP_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs, std::string* err) -> std::optional<std::string> {
  errno = 0;
  std::ifstream in(map_proc_path(abs), std::ios::binary);
  if (!in) {
    if (err) *err = errno ? std::strerror(errno) : std::string("cannot open ") + abs;
    return std::nullopt;
  }
  try {
    errno = 0;
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
      if (err) *err = errno ? std::strerror(errno) : std::string("read error on ") + abs;
      return std::nullopt;
    }
    return s;
  } catch (const std::ios_base::failure& e) {
    // Opened but unreadable (a directory, EIO, file gone mid-read)
    if (err) *err = errno ? std::strerror(errno) : std::string(e.what());
    return std::nullopt;
  }
}

} // namespace netsnap::util
