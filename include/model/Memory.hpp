#pragma once
#include <cstdint>

namespace hostpulse::model {

struct MemorySnapshot {
  uint64_t total{};        // bytes
  uint64_t used{};
  uint64_t available{};
  double   usage_percent{}; // 0..100, 0 when total is 0
  uint64_t swap_total{};
  uint64_t swap_used{};
  bool operator==(const MemorySnapshot&) const = default;
};

} // namespace hostpulse::model
