#include "util/Procfs.hpp"
#include "util/Log.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace hostpulse::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "HOSTPULSE_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "HOSTPULSE_SYS_ROOT");
}

auto map_etc_path(const std::string& abs) -> std::string {
  return remap(abs, "/etc", "HOSTPULSE_ETC_ROOT");
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  if (abs.rfind("/etc", 0) == 0) return map_etc_path(abs);
  return abs;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // File disappeared or became unreadable between open and read
  if (in.bad()) {
    log_debug("read failed: %s", abs.c_str());
    return std::nullopt;
  }
  return s;
}

auto read_first_line(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  std::string line;
  if (!std::getline(in, line)) return std::nullopt;
  while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  return line;
}

auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>> {
  std::vector<std::string> out;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return std::nullopt;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace hostpulse::util
