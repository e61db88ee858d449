#pragma once
#include <array>
#include <string>
#include "model/Identity.hpp"

namespace hostpulse::collectors {

// OS identity, uptime and load average. Every field is optional on the
// host side, so sampling never fails: missing values stay at their defaults.
class HostCollector {
public:
  void sample(hostpulse::model::SystemIdentity& out) const;
  // 1/5/15 minute load; false (and zeros) when /proc/loadavg is unavailable
  bool load_average(std::array<double, 3>& out) const;
};

// Value of KEY=... in os-release syntax, surrounding quotes removed
[[nodiscard]] std::string os_release_value(const std::string& text, const std::string& key);

} // namespace hostpulse::collectors
