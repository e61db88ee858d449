#pragma once
#include <stdexcept>
#include <vector>
#include "app/Config.hpp"
#include "app/GpuEstimator.hpp"
#include "model/Snapshot.hpp"

namespace hostpulse::app {

// A required host read failed; what() is the message returned to the caller
struct TelemetryError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Endpoint operations. Each call builds its own collectors and releases
// them on return, so calls share no mutable state and may run concurrently.
class Telemetry {
public:
  explicit Telemetry(Config cfg = {});

  [[nodiscard]] hostpulse::model::SystemIdentity system_identity() const;
  [[nodiscard]] hostpulse::model::CpuSnapshot cpu_snapshot() const;
  [[nodiscard]] hostpulse::model::MemorySnapshot memory_snapshot() const;
  [[nodiscard]] std::vector<hostpulse::model::DiskSnapshot> disk_snapshots() const;
  [[nodiscard]] std::vector<hostpulse::model::NetworkInterfaceSnapshot> network_snapshots() const;
  [[nodiscard]] hostpulse::model::RealtimeStats realtime_stats() const;
  [[nodiscard]] std::vector<hostpulse::model::ProcessSnapshot> top_processes(size_t limit) const;
  [[nodiscard]] std::vector<hostpulse::model::TemperatureReading> temperatures() const;
  [[nodiscard]] hostpulse::model::AdvancedSystemInfo advanced_info() const;
  [[nodiscard]] hostpulse::model::HostSnapshotBundle extended_snapshot() const;

  [[nodiscard]] const Config& config() const { return cfg_; }

private:
  void settle() const;
  Config cfg_;
  GpuEstimator gpu_;
};

} // namespace hostpulse::app
