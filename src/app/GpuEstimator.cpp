#include "app/GpuEstimator.hpp"
#include <algorithm>

namespace hostpulse::app {

GpuEstimator::GpuEstimator(std::string app_token) {
  rules_.push_back({{"chrome", "firefox", "edge"}, 0.3, 15.0});   // browsers
  rules_.push_back({{"game", "unity", "unreal"}, 2.0, 85.0});     // games and engines
  rules_.push_back({{"nvidia", "amd", "gpu"}, 1.5, 25.0});        // vendor tools
  if (!app_token.empty()) rules_.push_back({{std::move(app_token)}, 0.1, 5.0});
  rules_.push_back({{}, 0.05, 3.0});
}

double GpuEstimator::estimate(std::string_view process_name, double cpu_usage) const {
  for (const auto& rule : rules_) {
    bool hit = rule.tokens.empty();
    for (const auto& tok : rule.tokens) {
      if (process_name.find(tok) != std::string_view::npos) { hit = true; break; }
    }
    if (hit) return std::min(cpu_usage * rule.coefficient, rule.cap);
  }
  return 0.0;
}

} // namespace hostpulse::app
