#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "model/Disk.hpp"

namespace hostpulse::collectors {

class DiskCollector {
public:
  // One entry per mounted, user-visible filesystem in mount-table order
  bool sample(std::vector<hostpulse::model::DiskSnapshot>& out);
};

// Derive used space and percent from statvfs totals (saturating, 0% for empty volumes)
[[nodiscard]] hostpulse::model::DiskSnapshot make_disk_snapshot(std::string name, std::string mount_point,
                                                                std::string file_system,
                                                                uint64_t total, uint64_t available);

// Decode the octal escapes (\040, \011, \012, \134) used in /proc/self/mounts
[[nodiscard]] std::string unescape_mount_field(const std::string& s);

} // namespace hostpulse::collectors
