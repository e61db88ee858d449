#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostpulse::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

// Raw provider output for one CPU refresh
struct CpuReading {
  double usage_pct{};                // aggregate percent 0..100, 0 until two refreshes
  std::vector<double> per_core_pct;
  std::string vendor;                // vendor_id (static)
  std::string model;                 // CPU model name (static)
  int physical_cores{0};             // best-effort, 0 when unknown
  int logical_threads{0};
  uint64_t aggregate_mhz{0};         // mean of sysfs scaling_cur_freq, 0 when unavailable
  std::vector<uint64_t> per_core_mhz; // "cpu MHz" from /proc/cpuinfo, in processor order
};

struct CpuSnapshot {
  std::string name;
  std::string brand;
  double usage{};          // 0..100
  uint64_t frequency{};    // MHz
  uint64_t cores{};        // logical
  uint64_t physical_cores{};
  bool operator==(const CpuSnapshot&) const = default;
};

} // namespace hostpulse::model
