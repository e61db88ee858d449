#pragma once
#include <cstdint>
#include <string>

namespace hostpulse::model {

// Cumulative counters as of the call; no rate is derived
struct NetworkInterfaceSnapshot {
  std::string name;
  uint64_t received{};
  uint64_t transmitted{};
  bool operator==(const NetworkInterfaceSnapshot&) const = default;
};

} // namespace hostpulse::model
