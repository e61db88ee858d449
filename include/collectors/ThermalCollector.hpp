#pragma once
#include <vector>
#include "model/Thermal.hpp"

namespace hostpulse::collectors {

// Real sensor readings from /sys/class/hwmon, thermal_zone as fallback.
// Returns false when the host exposes no temperature sensor.
class ThermalCollector {
public:
  bool sample(std::vector<hostpulse::model::TemperatureReading>& out);
};

} // namespace hostpulse::collectors
