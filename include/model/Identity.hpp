#pragma once
#include <cstdint>
#include <string>

namespace hostpulse::model {

struct SystemIdentity {
  std::string name;            // distribution name
  std::string os_version;
  std::string kernel_version;
  std::string hostname;
  uint64_t uptime{};           // seconds
  uint64_t boot_time{};        // seconds since epoch
  bool operator==(const SystemIdentity&) const = default;
};

} // namespace hostpulse::model
