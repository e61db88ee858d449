#include "collectors/DiskCollector.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include "util/Utf8.hpp"

#include <sys/statvfs.h>
#include <sstream>
#include <unordered_set>

namespace hostpulse::collectors {

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","binfmt_misc","efivarfs","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

static uint64_t to_bytes(unsigned long long v) { return static_cast<uint64_t>(v); }

std::string unescape_mount_field(const std::string& s) {
  auto is_oct = [](char c){ return c >= '0' && c <= '7'; };
  std::string out; out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() && is_oct(s[i+1]) && is_oct(s[i+2]) && is_oct(s[i+3])) {
      int v = (s[i+1]-'0')*64 + (s[i+2]-'0')*8 + (s[i+3]-'0');
      out.push_back(static_cast<char>(v));
      i += 3;
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

hostpulse::model::DiskSnapshot make_disk_snapshot(std::string name, std::string mount_point,
                                                  std::string file_system,
                                                  uint64_t total, uint64_t available) {
  hostpulse::model::DiskSnapshot d;
  d.name = std::move(name);
  d.mount_point = std::move(mount_point);
  d.file_system = std::move(file_system);
  d.total_space = total;
  d.available_space = available;
  d.used_space = (total > available) ? (total - available) : 0ULL;
  d.usage_percent = (total > 0) ? (100.0 * (double)d.used_space / (double)total) : 0.0;
  return d;
}

bool DiskCollector::sample(std::vector<hostpulse::model::DiskSnapshot>& out) {
  out.clear();
  auto txt = hostpulse::util::read_file_string("/proc/self/mounts");
  if (!txt) return false;
  std::istringstream f(*txt);
  std::string line;
  while (std::getline(f, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (is_pseudo_fs(fstype)) continue;
    // Skip read-only special mounts like snap squashfs etc.
    if (fstype == "squashfs") continue;
    mountpoint = unescape_mount_field(mountpoint);

    struct statvfs vfs{};
    if (::statvfs(mountpoint.c_str(), &vfs) != 0) {
      hostpulse::util::log_debug("statvfs failed for %s", mountpoint.c_str());
      continue;
    }
    uint64_t total = to_bytes(vfs.f_blocks) * vfs.f_frsize;
    uint64_t avail = to_bytes(vfs.f_bavail) * vfs.f_frsize;
    // statvfs needs the raw path; the record carries its UTF-8 rendering
    out.push_back(make_disk_snapshot(hostpulse::util::to_valid_utf8(unescape_mount_field(device)),
                                     hostpulse::util::to_valid_utf8(mountpoint),
                                     hostpulse::util::to_valid_utf8(fstype), total, avail));
  }
  return true;
}

} // namespace hostpulse::collectors
