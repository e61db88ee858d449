#pragma once
#include "model/Process.hpp"
#include <unordered_map>

namespace hostpulse::collectors {

// Scans /proc/<pid>/stat. cpu_pct is derived from the previous sample,
// so a fresh collector reports 0 for every process on its first call.
class ProcessCollector {
public:
  ProcessCollector() = default;
  bool sample(hostpulse::model::ProcessTable& out);

  static bool parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime,
                              int64_t& rss_pages, std::string& comm);
private:
  std::unordered_map<int32_t, uint64_t> last_per_proc_{}; // pid -> total_time
  uint64_t last_cpu_total_{};
  bool have_last_{false};
  unsigned ncpu_{0};
};

} // namespace hostpulse::collectors
