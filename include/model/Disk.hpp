#pragma once
#include <cstdint>
#include <string>

namespace hostpulse::model {

// One mounted volume
struct DiskSnapshot {
  std::string name;         // device, e.g. /dev/nvme0n1p2
  std::string mount_point;
  std::string file_system;  // ext4, xfs, btrfs, ...
  uint64_t total_space{};
  uint64_t available_space{};
  uint64_t used_space{};    // total - available
  double   usage_percent{}; // 0..100
  bool operator==(const DiskSnapshot&) const = default;
};

} // namespace hostpulse::model
