#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Utf8.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

namespace hostpulse::collectors {

static void parse_cpu_line(const std::string_view& line, hostpulse::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static std::string trim(std::string s) {
  while (!s.empty() && (s.front()==' '||s.front()=='\t')) s.erase(s.begin());
  while (!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r')) s.pop_back();
  return s;
}

static std::string value_after_colon(const std::string& line) {
  auto pos = line.find(':');
  if (pos == std::string::npos) return {};
  return trim(line.substr(pos + 1));
}

void CpuCollector::load_static_info() {
  static_loaded_ = true;
  auto txt_opt = hostpulse::util::read_file_string("/proc/cpuinfo");
  if (!txt_opt) return;
  std::istringstream ss(*txt_opt);
  std::string line;
  std::string cur_phys;
  int cur_cpu_cores = -1;
  std::map<std::string,int> socket_cores;
  while (std::getline(ss, line)) {
    if (line.rfind("vendor_id", 0) == 0 && cpu_vendor_.empty()) {
      cpu_vendor_ = value_after_colon(line);
    }
    // common on x86
    if (line.rfind("model name", 0) == 0 && cpu_model_.empty()) {
      cpu_model_ = value_after_colon(line);
    }
    // arm variations
    if ((line.rfind("Hardware", 0) == 0 || line.rfind("Processor", 0) == 0) && cpu_model_.empty()) {
      cpu_model_ = value_after_colon(line);
    }
    if (line.rfind("CPU implementer", 0) == 0 && cpu_vendor_.empty()) {
      cpu_vendor_ = value_after_colon(line);
    }
    if (line.rfind("physical id", 0) == 0) {
      cur_phys = value_after_colon(line);
    }
    if (line.rfind("cpu cores", 0) == 0) {
      auto v = value_after_colon(line);
      int n = -1;
      auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      cur_cpu_cores = (ec == std::errc{}) ? n : -1;
    }
    if (line.empty()) {
      if (!cur_phys.empty() && cur_cpu_cores > 0) socket_cores.emplace(cur_phys, cur_cpu_cores);
      cur_phys.clear(); cur_cpu_cores = -1;
    }
  }
  // last block may not be followed by a blank line
  if (!cur_phys.empty() && cur_cpu_cores > 0) socket_cores.emplace(cur_phys, cur_cpu_cores);
  for (const auto& kv : socket_cores) physical_cores_ += kv.second;
  cpu_vendor_ = hostpulse::util::to_valid_utf8(cpu_vendor_);
  cpu_model_ = hostpulse::util::to_valid_utf8(cpu_model_);
}

// "cpu MHz" values in processor order
static std::vector<uint64_t> read_cpuinfo_mhz() {
  std::vector<uint64_t> out;
  auto txt_opt = hostpulse::util::read_file_string("/proc/cpuinfo");
  if (!txt_opt) return out;
  std::istringstream ss(*txt_opt);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu MHz", 0) != 0) continue;
    auto v = value_after_colon(line);
    double mhz = std::strtod(v.c_str(), nullptr);
    out.push_back(mhz > 0.0 ? static_cast<uint64_t>(std::llround(mhz)) : 0);
  }
  return out;
}

// Mean of scaling_cur_freq (kHz) across cores; 0 when cpufreq is not exposed
static uint64_t read_sysfs_aggregate_mhz(size_t ncores) {
  uint64_t sum_khz = 0; size_t n = 0;
  for (size_t i = 0; i < ncores; ++i) {
    auto line = hostpulse::util::read_first_line(
        "/sys/devices/system/cpu/cpu" + std::to_string(i) + "/cpufreq/scaling_cur_freq");
    if (!line) continue;
    uint64_t khz = 0;
    auto [p, ec] = std::from_chars(line->data(), line->data() + line->size(), khz);
    if (ec != std::errc{} || khz == 0) continue;
    sum_khz += khz; ++n;
  }
  if (n == 0) return 0;
  return (sum_khz / n) / 1000;
}

bool CpuCollector::sample(hostpulse::model::CpuReading& out) {
  if (!static_loaded_) load_static_info();
  auto txt_opt = hostpulse::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  hostpulse::model::CpuTimes agg{}; std::vector<hostpulse::model::CpuTimes> per;
  bool have_agg = false;
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); after_cpu = true; have_agg = true; }
    else if (after_cpu && line.starts_with("cpu")) { hostpulse::model::CpuTimes t{}; parse_cpu_line(line, t); per.push_back(t); }
    else if (after_cpu) break;
    start = end + 1;
  }
  if (!have_agg) return false;
  // compute deltas
  double usage = 0.0; std::vector<double> per_pct(per.size(), 0.0);
  if (has_last_) {
    auto td = agg.total() - last_total_.total();
    auto wd = agg.work()  - last_total_.work();
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
    for (size_t i = 0; i < per.size(); ++i) {
      if (i < last_per_.size()) {
        auto tdi = per[i].total() - last_per_[i].total();
        auto wdi = per[i].work()  - last_per_[i].work();
        per_pct[i] = (tdi > 0) ? (100.0 * static_cast<double>(wdi) / static_cast<double>(tdi)) : 0.0;
      }
    }
  }
  out.logical_threads = per.empty() ? 1 : static_cast<int>(per.size());
  last_total_ = agg; last_per_ = std::move(per); has_last_ = true;
  out.usage_pct = usage; out.per_core_pct = std::move(per_pct);
  out.vendor = cpu_vendor_;
  out.model = cpu_model_;
  out.physical_cores = physical_cores_;
  out.aggregate_mhz = read_sysfs_aggregate_mhz(static_cast<size_t>(out.logical_threads));
  out.per_core_mhz = read_cpuinfo_mhz();
  return true;
}

} // namespace hostpulse::collectors
