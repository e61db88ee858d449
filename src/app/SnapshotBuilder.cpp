#include "app/SnapshotBuilder.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>

namespace hostpulse::app {

uint64_t resolve_frequency_mhz(uint64_t aggregate_mhz, const std::vector<uint64_t>& per_core_mhz) {
  if (aggregate_mhz > 0) return aggregate_mhz;
  if (!per_core_mhz.empty()) return per_core_mhz.front();
  return 0;
}

hostpulse::model::CpuSnapshot make_cpu_snapshot(const hostpulse::model::CpuReading& r) {
  hostpulse::model::CpuSnapshot s;
  s.name = r.vendor;
  s.brand = r.model;
  s.usage = std::clamp(r.usage_pct, 0.0, 100.0);
  s.frequency = resolve_frequency_mhz(r.aggregate_mhz, r.per_core_mhz);
  s.cores = r.logical_threads > 0 ? static_cast<uint64_t>(r.logical_threads) : 0;
  s.physical_cores = r.physical_cores > 0 ? static_cast<uint64_t>(r.physical_cores) : 0;
  return s;
}

hostpulse::model::RealtimeStats make_realtime_stats(double cpu_usage, const hostpulse::model::MemorySnapshot& mem) {
  hostpulse::model::RealtimeStats st;
  st.cpu_usage = std::clamp(cpu_usage, 0.0, 100.0);
  st.memory_usage = mem.total > 0 ? (100.0 * static_cast<double>(mem.used) / static_cast<double>(mem.total)) : 0.0;
  st.memory_used_gb = static_cast<double>(mem.used) / kBytesPerGiB;
  st.memory_total_gb = static_cast<double>(mem.total) / kBytesPerGiB;
  return st;
}

double normalize_cpu_usage(double raw_pct, unsigned logical_cpus) {
  if (logical_cpus == 0) logical_cpus = 1;
  return std::clamp(raw_pct / static_cast<double>(logical_cpus), 0.0, 100.0);
}

std::vector<hostpulse::model::ProcessSnapshot> select_top_processes(
    const hostpulse::model::ProcessTable& table, size_t limit, const GpuEstimator& gpu) {
  std::vector<hostpulse::model::ProcessSnapshot> out;
  out.reserve(table.processes.size());
  for (const auto& p : table.processes) {
    hostpulse::model::ProcessSnapshot ps;
    ps.name = p.comm;
    ps.pid = p.pid;
    ps.cpu_usage = normalize_cpu_usage(p.cpu_pct, table.logical_cpus);
    ps.memory = p.rss_kb * 1024;
    ps.gpu_usage = gpu.estimate(ps.name, ps.cpu_usage);
    out.push_back(std::move(ps));
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.cpu_usage > b.cpu_usage; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<hostpulse::model::TemperatureReading> placeholder_temperatures() {
  return estimate_temperatures(0.0);
}

std::vector<hostpulse::model::TemperatureReading> estimate_temperatures(double cpu_usage) {
  std::vector<hostpulse::model::TemperatureReading> out(2);
  out[0].component = "CPU Package";
  out[0].temperature = kPackageBaselineC + cpu_usage * 0.5;
  out[0].max_temperature = 100.0;
  out[0].critical_temperature = 105.0;
  out[0].synthetic = true;
  out[1].component = "System";
  out[1].temperature = kSystemBaselineC + cpu_usage * 0.3;
  out[1].max_temperature = 85.0;
  out[1].synthetic = true;
  return out;
}

std::map<std::string, std::pair<uint64_t, uint64_t>> make_network_activity(
    const std::vector<hostpulse::model::NetworkInterfaceSnapshot>& ifs) {
  std::map<std::string, std::pair<uint64_t, uint64_t>> out;
  for (const auto& n : ifs) out[n.name] = {n.received, n.transmitted};
  return out;
}

hostpulse::model::AdvancedSystemInfo make_advanced_info(size_t process_count, const std::array<double, 3>& load) {
  hostpulse::model::AdvancedSystemInfo a;
  a.process_count = process_count;
  a.total_processes = process_count;
  a.load_average = load;
  a.users_count = 1;
  return a;
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
  auto secs = static_cast<std::time_t>(ms / 1000);
  int millis = static_cast<int>(ms % 1000);
  if (millis < 0) { millis += 1000; secs -= 1; }
  std::tm tm{};
  ::gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
  return buf;
}

} // namespace hostpulse::app
