#include "app/Telemetry.hpp"
#include "app/SnapshotBuilder.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/HostCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include "collectors/ThermalCollector.hpp"
#include "util/Log.hpp"

#include <thread>

namespace hostpulse::app {

using namespace hostpulse::collectors;
using namespace hostpulse::model;

Telemetry::Telemetry(Config cfg) : cfg_(std::move(cfg)), gpu_(cfg_.app_token) {}

void Telemetry::settle() const {
  if (cfg_.settle.count() > 0) std::this_thread::sleep_for(cfg_.settle);
}

static void require(bool ok, const char* what) {
  if (!ok) throw TelemetryError(what);
}

SystemIdentity Telemetry::system_identity() const {
  SystemIdentity id;
  HostCollector{}.sample(id);
  return id;
}

CpuSnapshot Telemetry::cpu_snapshot() const {
  CpuCollector cpu;
  CpuReading r;
  require(cpu.sample(r), "failed to read CPU counters");
  settle();
  require(cpu.sample(r), "failed to read CPU counters");
  return make_cpu_snapshot(r);
}

MemorySnapshot Telemetry::memory_snapshot() const {
  MemorySnapshot m;
  require(MemoryCollector{}.sample(m), "failed to read memory information");
  return m;
}

std::vector<DiskSnapshot> Telemetry::disk_snapshots() const {
  std::vector<DiskSnapshot> out;
  require(DiskCollector{}.sample(out), "failed to read mount table");
  return out;
}

std::vector<NetworkInterfaceSnapshot> Telemetry::network_snapshots() const {
  std::vector<NetworkInterfaceSnapshot> out;
  require(NetCollector{}.sample(out), "failed to read network interfaces");
  return out;
}

RealtimeStats Telemetry::realtime_stats() const {
  CpuCollector cpu;
  CpuReading r;
  require(cpu.sample(r), "failed to read CPU counters");
  settle();
  require(cpu.sample(r), "failed to read CPU counters");
  MemorySnapshot m;
  require(MemoryCollector{}.sample(m), "failed to read memory information");
  return make_realtime_stats(r.usage_pct, m);
}

std::vector<ProcessSnapshot> Telemetry::top_processes(size_t limit) const {
  ProcessCollector procs;
  ProcessTable table;
  require(procs.sample(table), "failed to read process table");
  settle();
  require(procs.sample(table), "failed to read process table");
  return select_top_processes(table, limit, gpu_);
}

std::vector<TemperatureReading> Telemetry::temperatures() const {
  if (cfg_.thermal_source == ThermalSource::Hwmon) {
    std::vector<TemperatureReading> out;
    if (ThermalCollector{}.sample(out)) return out;
    hostpulse::util::log_debug("no hwmon sensors found, reporting placeholder temperatures");
  }
  return placeholder_temperatures();
}

AdvancedSystemInfo Telemetry::advanced_info() const {
  ProcessCollector procs;
  ProcessTable table;
  require(procs.sample(table), "failed to read process table");
  std::array<double, 3> load{};
  if (!HostCollector{}.load_average(load)) hostpulse::util::log_debug("load average unavailable");
  return make_advanced_info(table.total_processes, load);
}

HostSnapshotBundle Telemetry::extended_snapshot() const {
  CpuCollector cpu;
  ProcessCollector procs;
  CpuReading r;
  ProcessTable table;
  require(cpu.sample(r), "failed to read CPU counters");
  require(procs.sample(table), "failed to read process table");
  settle();
  require(cpu.sample(r), "failed to read CPU counters");
  require(procs.sample(table), "failed to read process table");

  MemorySnapshot m;
  require(MemoryCollector{}.sample(m), "failed to read memory information");
  std::vector<NetworkInterfaceSnapshot> nets;
  require(NetCollector{}.sample(nets), "failed to read network interfaces");

  HostSnapshotBundle b;
  b.stats = make_realtime_stats(r.usage_pct, m);
  b.temperatures = estimate_temperatures(b.stats.cpu_usage);
  b.network_activity = make_network_activity(nets);
  b.top_processes = select_top_processes(table, static_cast<size_t>(cfg_.extended_top_limit), gpu_);
  b.timestamp = format_rfc3339(std::chrono::system_clock::now());
  return b;
}

} // namespace hostpulse::app
