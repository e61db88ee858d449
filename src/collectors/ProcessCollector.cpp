#include "collectors/ProcessCollector.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include "util/Utf8.hpp"
#include <cctype>
#include <charconv>
#include <sstream>
#include <string_view>
#include <unistd.h>

namespace hostpulse::collectors {

static uint64_t read_cpu_total() {
  auto txt = hostpulse::util::read_file_string("/proc/stat"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string line; if (!std::getline(ss, line)) return 0;
  // parse after 'cpu '
  size_t pos = line.find(' '); if (pos == std::string::npos) return 0;
  std::string_view rest(line.c_str() + pos + 1);
  uint64_t vals[8]{}; int i=0; size_t start=0;
  while (i<8 && start<rest.size()) {
    while (start<rest.size() && (rest[start]==' '||rest[start]=='\t')) ++start;
    size_t end=start; while (end<rest.size() && rest[end]>='0'&&rest[end]<='9') ++end;
    if (end>start) { std::from_chars(rest.data()+start, rest.data()+end, vals[i++]); }
    start=end+1;
  }
  uint64_t total=0; for (int j=0;j<8;++j) total+=vals[j]; return total;
}

static unsigned read_cpu_count() {
  auto txt = hostpulse::util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // skip aggregate 'cpu '
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break; // stop after cpu block
    }
  }
  if (count == 0) count = 1;
  return count;
}

bool ProcessCollector::parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime,
                                       int64_t& rss_pages, std::string& comm) {
  // comm may itself contain ')' or spaces: take the outermost parentheses
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp==std::string::npos||rp==std::string::npos||rp<lp) return false;
  comm = content.substr(lp+1, rp-lp-1);
  if (rp + 2 > content.size()) return false;
  std::istringstream ss(content.substr(rp+2));
  char state = '?'; int32_t ppid = 0;
  ss >> state >> ppid;
  // skip fields up to utime (9 fields)
  for (int i=0;i<9;i++){ std::string tmp; ss >> tmp; }
  ss >> utime >> stime;
  // Skip: cutime, cstime, priority, nice, num_threads, itrealvalue, starttime (7 fields)
  for (int i=0;i<7;i++){ std::string tmp; ss >> tmp; }
  unsigned long long vsize_bytes = 0;
  ss >> vsize_bytes; // discard vsize
  ss >> rss_pages;
  return !ss.fail();
}

bool ProcessCollector::sample(hostpulse::model::ProcessTable& out) {
  auto entries = hostpulse::util::list_dir("/proc");
  if (!entries) return false;
  uint64_t cpu_total = read_cpu_total();
  if (ncpu_ == 0) ncpu_ = read_cpu_count();
  const long page_kb = ::sysconf(_SC_PAGESIZE) / 1024;
  out.processes.clear(); out.total_processes = 0; out.logical_cpus = ncpu_;
  std::unordered_map<int32_t, uint64_t> totals;

  for (auto& name : *entries) {
    if (name.empty() || name[0]<'0' || name[0]>'9') continue; // numeric
    int32_t pid = 0;
    auto [p, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{}) continue;
    auto content_opt = hostpulse::util::read_file_string("/proc/" + name + "/stat");
    if (!content_opt) {
      // exited between listing and read
      hostpulse::util::log_debug("pid %d vanished during scan", pid);
      continue;
    }
    uint64_t ut=0, st=0; int64_t rssp=0; std::string comm;
    if (!parse_stat_line(*content_opt, ut, st, rssp, comm)) {
      hostpulse::util::log_debug("unparsable stat for pid %d", pid);
      continue;
    }
    uint64_t total_proc = ut + st;
    double cpu_pct = 0.0;
    if (have_last_) {
      auto it = last_per_proc_.find(pid);
      uint64_t lastp = (it==last_per_proc_.end()) ? total_proc : it->second;
      uint64_t dp = (total_proc > lastp) ? (total_proc - lastp) : 0;
      uint64_t dt = (cpu_total > last_cpu_total_) ? (cpu_total - last_cpu_total_) : 0;
      if (dt>0) cpu_pct = (100.0 * static_cast<double>(dp) / static_cast<double>(dt)) * static_cast<double>(ncpu_);
    }
    hostpulse::model::ProcSample ps;
    ps.pid = pid;
    ps.rss_kb = (rssp > 0 && page_kb > 0) ? static_cast<uint64_t>(rssp) * static_cast<uint64_t>(page_kb) : 0;
    ps.cpu_pct = cpu_pct; ps.comm = hostpulse::util::to_valid_utf8(comm);
    out.processes.push_back(std::move(ps));
    totals[pid] = total_proc;
  }
  out.total_processes = out.processes.size();
  last_per_proc_ = std::move(totals);
  last_cpu_total_ = cpu_total; have_last_ = true;
  return true;
}

} // namespace hostpulse::collectors
