// Utility helpers for reading /proc, /sys and /etc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace hostpulse::util {

// Map an absolute /proc path to an alternate root if HOSTPULSE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if HOSTPULSE_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map an absolute /etc path to an alternate root if HOSTPULSE_ETC_ROOT is set
auto map_etc_path(const std::string& abs) -> std::string;

// Apply whichever of the above matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first line of a file, trailing whitespace removed.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns std::nullopt if the directory cannot be opened.
auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>>;

} // namespace hostpulse::util
