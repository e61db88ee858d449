#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostpulse::model {

// Raw per-process provider output for one refresh
struct ProcSample {
  int32_t pid{};
  uint64_t rss_kb{};
  double   cpu_pct{};     // percent of one core; exceeds 100 for multi-threaded load
  std::string comm;
};

struct ProcessTable {
  std::vector<ProcSample> processes; // enumeration order of /proc
  size_t total_processes{};
  unsigned logical_cpus{1};
};

struct ProcessSnapshot {
  std::string name;
  int32_t pid{};
  double cpu_usage{};   // normalized: raw / logical cores, 0..100
  uint64_t memory{};    // resident bytes
  double gpu_usage{};   // heuristic estimate, not measured
  bool operator==(const ProcessSnapshot&) const = default;
};

} // namespace hostpulse::model
