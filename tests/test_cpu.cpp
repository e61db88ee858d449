#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/CpuCollector.hpp"
#include "app/SnapshotBuilder.hpp"

TEST(cpu_collector_delta_usage) {
  auto root = make_root("cpu_delta");
  write_file(root / "proc/stat", "cpu  100 0 100 1000 0 0 0 0\n"
                                 "cpu0 50 0 50 500 0 0 0 0\n"
                                 "cpu1 50 0 50 500 0 0 0 0\n"
                                 "intr 12345\n");
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  ScopedEnv sys("HOSTPULSE_SYS_ROOT", root.string());
  hostpulse::collectors::CpuCollector c;
  hostpulse::model::CpuReading r{};
  ASSERT_TRUE(c.sample(r));
  // First refresh has no baseline
  ASSERT_NEAR(r.usage_pct, 0.0, 1e-9);
  write_file(root / "proc/stat", "cpu  150 0 150 1100 0 0 0 0\n"
                                 "cpu0 100 0 100 500 0 0 0 0\n"
                                 "cpu1 50 0 50 600 0 0 0 0\n");
  ASSERT_TRUE(c.sample(r));
  ASSERT_NEAR(r.usage_pct, 50.0, 1e-6);
  ASSERT_EQ(r.per_core_pct.size(), 2u);
  ASSERT_NEAR(r.per_core_pct[0], 100.0, 1e-6);
  ASSERT_NEAR(r.per_core_pct[1], 0.0, 1e-6);
  ASSERT_EQ(r.logical_threads, 2);
}

TEST(cpu_collector_fails_without_aggregate_line) {
  auto root = make_root("cpu_noagg");
  write_file(root / "proc/stat", "intr 1 2 3\nctxt 99\n");
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  hostpulse::collectors::CpuCollector c;
  hostpulse::model::CpuReading r{};
  ASSERT_TRUE(!c.sample(r));
}

TEST(cpu_collector_reads_static_info) {
  auto root = make_root("cpu_static");
  write_file(root / "proc/stat", "cpu  1 0 1 10 0 0 0 0\ncpu0 1 0 1 10 0 0 0 0\ncpu1 0 0 0 0 0 0 0 0\n");
  write_file(root / "proc/cpuinfo",
             "processor\t: 0\n"
             "vendor_id\t: GenuineIntel\n"
             "model name\t: Intel(R) Core(TM) i7-9700K CPU @ 3.60GHz\n"
             "cpu MHz\t\t: 3600.000\n"
             "physical id\t: 0\n"
             "cpu cores\t: 2\n"
             "\n"
             "processor\t: 1\n"
             "vendor_id\t: GenuineIntel\n"
             "model name\t: Intel(R) Core(TM) i7-9700K CPU @ 3.60GHz\n"
             "cpu MHz\t\t: 1200.400\n"
             "physical id\t: 0\n"
             "cpu cores\t: 2\n");
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  ScopedEnv sys("HOSTPULSE_SYS_ROOT", root.string());
  hostpulse::collectors::CpuCollector c;
  hostpulse::model::CpuReading r{};
  ASSERT_TRUE(c.sample(r));
  ASSERT_EQ(r.vendor, std::string("GenuineIntel"));
  ASSERT_EQ(r.model, std::string("Intel(R) Core(TM) i7-9700K CPU @ 3.60GHz"));
  ASSERT_EQ(r.physical_cores, 2);
  ASSERT_EQ(r.per_core_mhz.size(), 2u);
  ASSERT_EQ(r.per_core_mhz[0], 3600u);
  ASSERT_EQ(r.per_core_mhz[1], 1200u);
  // no cpufreq directory under the fake sys root
  ASSERT_EQ(r.aggregate_mhz, 0u);

  auto snap = hostpulse::app::make_cpu_snapshot(r);
  ASSERT_EQ(snap.name, std::string("GenuineIntel"));
  ASSERT_EQ(snap.frequency, 3600u);
  ASSERT_EQ(snap.cores, 2u);
  ASSERT_EQ(snap.physical_cores, 2u);
}

TEST(cpu_collector_prefers_cpufreq_mean) {
  auto root = make_root("cpu_freq");
  write_file(root / "proc/stat", "cpu  1 0 1 10 0 0 0 0\ncpu0 1 0 1 10 0 0 0 0\ncpu1 0 0 0 0 0 0 0 0\n");
  write_file(root / "proc/cpuinfo", "processor\t: 0\ncpu MHz\t\t: 800.000\n");
  write_file(root / "sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq", "2000000\n");
  write_file(root / "sys/devices/system/cpu/cpu1/cpufreq/scaling_cur_freq", "3000000\n");
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  ScopedEnv sys("HOSTPULSE_SYS_ROOT", root.string());
  hostpulse::collectors::CpuCollector c;
  hostpulse::model::CpuReading r{};
  ASSERT_TRUE(c.sample(r));
  ASSERT_EQ(r.aggregate_mhz, 2500u);
  ASSERT_EQ(hostpulse::app::make_cpu_snapshot(r).frequency, 2500u);
}
