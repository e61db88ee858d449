#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "model/Identity.hpp"
#include "model/Cpu.hpp"
#include "model/Memory.hpp"
#include "model/Disk.hpp"
#include "model/Net.hpp"
#include "model/Process.hpp"
#include "model/Thermal.hpp"

namespace hostpulse::model {

struct RealtimeStats {
  double cpu_usage{};
  double memory_usage{};
  double memory_used_gb{};
  double memory_total_gb{};
  bool operator==(const RealtimeStats&) const = default;
};

struct AdvancedSystemInfo {
  uint64_t process_count{};
  uint64_t total_processes{};            // same value as process_count
  std::array<double, 3> load_average{};  // 1, 5, 15 minutes; zeros when unavailable
  uint64_t users_count{1};               // placeholder
  bool operator==(const AdvancedSystemInfo&) const = default;
};

struct HostSnapshotBundle {
  RealtimeStats stats;
  std::vector<TemperatureReading> temperatures;
  // interface -> (received, transmitted)
  std::map<std::string, std::pair<uint64_t, uint64_t>> network_activity;
  std::vector<ProcessSnapshot> top_processes;
  std::string timestamp; // RFC 3339, UTC
  bool operator==(const HostSnapshotBundle&) const = default;
};

} // namespace hostpulse::model
