#pragma once
#include <optional>
#include <string>

namespace hostpulse::model {

struct TemperatureReading {
  std::string component;
  double temperature{0.0};                    // °C
  std::optional<double> max_temperature;
  std::optional<double> critical_temperature;
  bool synthetic{true};                       // placeholder, not read from a sensor
  bool operator==(const TemperatureReading&) const = default;
};

} // namespace hostpulse::model
