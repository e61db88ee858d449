#include "app/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <string_view>

namespace hostpulse::app {

static constexpr int kMaxSettleMs = 5000;
static constexpr int kMaxTopLimit = 4096;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HOSTPULSE_", 0) == 0) {
    alt = std::string("hostpulse_") + n.substr(10);
    for (auto& c : alt) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int out = 0;
  std::string_view sv(v);
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
    hostpulse::util::log_error("ignoring %s=%s (not an integer)", name, v);
    return defv;
  }
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/hostpulse/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/hostpulse/config.toml";
  return {};
}

std::optional<ThermalSource> parse_thermal_source(const std::string& s) {
  std::string v = s;
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v == "synthetic" || v == "placeholder") return ThermalSource::Synthetic;
  if (v == "hwmon" || v == "sensors") return ThermalSource::Hwmon;
  return std::nullopt;
}

static void apply_thermal(Config& c, const std::string& value, const char* origin) {
  if (value.empty()) return;
  if (auto src = parse_thermal_source(value)) c.thermal_source = *src;
  else hostpulse::util::log_error("%s: unknown thermal source '%s'", origin, value.c_str());
}

Config load_config(const std::optional<std::string>& explicit_path) {
  Config c;
  std::string path = explicit_path ? *explicit_path : config_file_path();
  hostpulse::util::TomlReader toml;
  bool have_toml = false;
  if (!path.empty()) {
    std::error_code ec;
    if (explicit_path || std::filesystem::exists(path, ec)) {
      have_toml = toml.load(path);
      if (!have_toml) hostpulse::util::log_error("cannot read config %s", path.c_str());
    }
  }

  int settle_ms = static_cast<int>(c.settle.count());
  if (have_toml) {
    settle_ms = toml.get_int("sampling", "settle_ms", settle_ms);
    c.top_limit = toml.get_int("processes", "top_limit", c.top_limit);
    c.extended_top_limit = toml.get_int("processes", "extended_top_limit", c.extended_top_limit);
    if (toml.has("gpu", "app_token")) c.app_token = toml.get_string("gpu", "app_token");
    apply_thermal(c, toml.get_string("thermal", "source"), path.c_str());
  }

  settle_ms = getenv_int("HOSTPULSE_SETTLE_MS", settle_ms);
  c.top_limit = getenv_int("HOSTPULSE_TOP_LIMIT", c.top_limit);
  c.extended_top_limit = getenv_int("HOSTPULSE_EXTENDED_TOP_LIMIT", c.extended_top_limit);
  if (const char* tok = getenv_compat("HOSTPULSE_APP_TOKEN")) c.app_token = tok;
  if (const char* src = getenv_compat("HOSTPULSE_THERMAL_SOURCE")) apply_thermal(c, src, "HOSTPULSE_THERMAL_SOURCE");

  c.settle = std::chrono::milliseconds(std::clamp(settle_ms, 0, kMaxSettleMs));
  c.top_limit = std::clamp(c.top_limit, 0, kMaxTopLimit);
  c.extended_top_limit = std::clamp(c.extended_top_limit, 0, kMaxTopLimit);
  hostpulse::util::log_debug("config: settle=%lldms top=%d extended_top=%d token=%s",
                             static_cast<long long>(c.settle.count()), c.top_limit,
                             c.extended_top_limit, c.app_token.c_str());
  return c;
}

} // namespace hostpulse::app
