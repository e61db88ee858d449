#pragma once
#include "model/Cpu.hpp"

namespace hostpulse::collectors {

// Refresh-then-read CPU provider. usage_pct needs two samples: the first
// call only records the cumulative counters.
class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(hostpulse::model::CpuReading& out);
private:
  void load_static_info();
  hostpulse::model::CpuTimes last_total_{};
  std::vector<hostpulse::model::CpuTimes> last_per_{};
  bool has_last_{false};
  bool static_loaded_{false};
  std::string cpu_vendor_{};
  std::string cpu_model_{};
  int physical_cores_{0};
};

} // namespace hostpulse::collectors
