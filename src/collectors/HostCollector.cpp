#include "collectors/HostCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Utf8.hpp"

#include <sys/utsname.h>

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace hostpulse::collectors {

std::string os_release_value(const std::string& text, const std::string& key) {
  std::istringstream ss(text);
  std::string line;
  const std::string prefix = key + "=";
  while (std::getline(ss, line)) {
    if (line.rfind(prefix, 0) != 0) continue;
    std::string v = line.substr(prefix.size());
    while (!v.empty() && (v.back()=='\r'||v.back()==' ')) v.pop_back();
    if (v.size() >= 2 && (v.front()=='"' || v.front()=='\'') && v.back()==v.front())
      v = v.substr(1, v.size() - 2);
    return hostpulse::util::to_valid_utf8(v);
  }
  return {};
}

static uint64_t read_uptime_secs() {
  auto line = hostpulse::util::read_first_line("/proc/uptime");
  if (!line) return 0;
  double up = std::strtod(line->c_str(), nullptr);
  return up > 0.0 ? static_cast<uint64_t>(up) : 0;
}

static uint64_t read_boot_time() {
  auto txt = hostpulse::util::read_file_string("/proc/stat");
  if (!txt) return 0;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("btime ", 0) != 0) continue;
    uint64_t v = 0;
    std::from_chars(line.data() + 6, line.data() + line.size(), v);
    return v;
  }
  return 0;
}

void HostCollector::sample(hostpulse::model::SystemIdentity& out) const {
  struct utsname uts{};
  bool have_uts = ::uname(&uts) == 0;

  auto osr = hostpulse::util::read_file_string("/etc/os-release");
  if (!osr) osr = hostpulse::util::read_file_string("/usr/lib/os-release");
  if (osr) {
    out.name = os_release_value(*osr, "NAME");
    out.os_version = os_release_value(*osr, "VERSION_ID");
  }
  if (auto rel = hostpulse::util::read_first_line("/proc/sys/kernel/osrelease"); rel && !rel->empty())
    out.kernel_version = *rel;
  else if (have_uts)
    out.kernel_version = uts.release;
  if (auto hn = hostpulse::util::read_first_line("/proc/sys/kernel/hostname"); hn && !hn->empty())
    out.hostname = *hn;
  else if (have_uts)
    out.hostname = uts.nodename;
  out.kernel_version = hostpulse::util::to_valid_utf8(out.kernel_version);
  out.hostname = hostpulse::util::to_valid_utf8(out.hostname);
  out.uptime = read_uptime_secs();
  out.boot_time = read_boot_time();
}

bool HostCollector::load_average(std::array<double, 3>& out) const {
  out = {0.0, 0.0, 0.0};
  auto line = hostpulse::util::read_first_line("/proc/loadavg");
  if (!line) return false;
  std::istringstream ss(*line);
  double a = 0, b = 0, c = 0;
  if (!(ss >> a >> b >> c)) return false;
  out = {a, b, c};
  return true;
}

} // namespace hostpulse::collectors
