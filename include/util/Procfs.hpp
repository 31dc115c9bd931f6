// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace hostsnap::util {

// Map an absolute /proc path to an alternate root if HOSTSNAP_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if HOSTSNAP_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string. /proc and /sys paths are remapped first.
// Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace hostsnap::util
