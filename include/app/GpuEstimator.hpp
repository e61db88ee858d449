#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace hostpulse::app {

// One row of the name heuristic: any token matches -> min(cpu * coefficient, cap).
// A rule with no tokens matches every name.
struct GpuRule {
  std::vector<std::string> tokens;
  double coefficient{};
  double cap{};
};

// Synthetic per-process GPU usage. No GPU counter is read: the figure is
// derived from the process name and its normalized CPU usage, and callers
// must present it as an estimate.
class GpuEstimator {
public:
  explicit GpuEstimator(std::string app_token = "hostpulse");

  // Case-sensitive substring match, rules evaluated top-down, first match wins
  [[nodiscard]] double estimate(std::string_view process_name, double cpu_usage) const;

  [[nodiscard]] const std::vector<GpuRule>& rules() const { return rules_; }

private:
  std::vector<GpuRule> rules_;
};

} // namespace hostpulse::app
