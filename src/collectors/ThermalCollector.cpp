#include "collectors/ThermalCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Utf8.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace hostpulse::collectors {

static bool read_number_file(const fs::path& p, long& out) {
  std::ifstream f(p);
  if (!f) return false;
  f >> out; return !f.fail();
}

static std::string read_label(const fs::path& p) {
  std::ifstream f(p);
  std::string s;
  if (f) std::getline(f, s);
  while (!s.empty() && (s.back()=='\n'||s.back()=='\r'||s.back()==' ')) s.pop_back();
  return s;
}

static std::vector<fs::path> sorted_entries(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  fs::directory_iterator it(dir, ec), end;
  for (; !ec && it != end; it.increment(ec)) out.push_back(it->path());
  std::sort(out.begin(), out.end());
  return out;
}

// Read from hwmon first; fallback to thermal_zone
bool ThermalCollector::sample(std::vector<hostpulse::model::TemperatureReading>& out) {
  out.clear();
  std::error_code ec;
  // hwmon: /sys/class/hwmon/hwmon*/temp*_input (millidegrees C)
  fs::path hw(hostpulse::util::map_sys_path("/sys/class/hwmon"));
  if (fs::exists(hw, ec)) {
    for (const auto& dev : sorted_entries(hw)) {
      std::string chip = read_label(dev / "name");
      for (const auto& e : sorted_entries(dev)) {
        auto name = e.filename().string();
        if (name.rfind("temp",0)!=0 || name.find("_input")==std::string::npos) continue;
        long mdeg = 0; if (!read_number_file(e, mdeg)) continue;
        auto base = name.substr(0, name.find("_input"));
        hostpulse::model::TemperatureReading r;
        r.synthetic = false;
        r.temperature = mdeg / 1000.0;
        std::string label = read_label(dev / (base + "_label"));
        if (label.empty()) label = chip.empty() ? base : chip + " " + base;
        r.component = hostpulse::util::to_valid_utf8(label);
        long thr = 0;
        if (read_number_file(dev / (base + "_max"), thr) && thr > 0) r.max_temperature = thr / 1000.0;
        if (read_number_file(dev / (base + "_crit"), thr) && thr > 0) r.critical_temperature = thr / 1000.0;
        out.push_back(std::move(r));
      }
    }
  }
  if (out.empty()) {
    fs::path tz(hostpulse::util::map_sys_path("/sys/class/thermal"));
    if (fs::exists(tz, ec)) {
      for (const auto& z : sorted_entries(tz)) {
        if (z.filename().string().rfind("thermal_zone",0)!=0) continue;
        long mdeg=0; if (!read_number_file(z / "temp", mdeg)) continue;
        hostpulse::model::TemperatureReading r;
        r.synthetic = false;
        r.temperature = mdeg / 1000.0;
        r.component = read_label(z / "type");
        if (r.component.empty()) r.component = z.filename().string();
        r.component = hostpulse::util::to_valid_utf8(r.component);
        out.push_back(std::move(r));
      }
    }
  }
  return !out.empty();
}

} // namespace hostpulse::collectors
