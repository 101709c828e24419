// Helpers for reading /proc and plain text files, with optional root remap for tests
#pragma once
#include <optional>
#include <string>

namespace netsnap::util {

// Map an absolute /proc path to an alternate root if NETSNAP_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error and, if err is
// non-null, stores the OS error text there.
auto read_file_string(const std::string& abs, std::string* err = nullptr) -> std::optional<std::string>;

} // namespace netsnap::util
