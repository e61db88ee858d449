#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace hostpulse::app {

enum class ThermalSource { Synthetic, Hwmon };

struct Config {
  // Wait between the two counter refreshes that produce a CPU rate
  std::chrono::milliseconds settle{200};
  int top_limit{15};
  int extended_top_limit{5};
  std::string app_token{"hostpulse"};
  ThermalSource thermal_source{ThermalSource::Synthetic};
};

// Environment variable helpers (HOSTPULSE_X or hostpulse_x)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/hostpulse/config.toml, else ~/.config/hostpulse/config.toml; empty if neither is known
std::string config_file_path();

std::optional<ThermalSource> parse_thermal_source(const std::string& s);

// Resolve defaults <- TOML file <- environment. An explicit path that cannot
// be read is reported on stderr and skipped.
Config load_config(const std::optional<std::string>& explicit_path = std::nullopt);

} // namespace hostpulse::app
