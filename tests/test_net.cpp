#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/NetCollector.hpp"

static const char* kNetDev =
  "Inter-|   Receive                                                |  Transmit\n"
  " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
  "    lo: 123456     100    0    0    0     0          0         0   123456     100    0    0    0     0       0          0\n"
  "  eth0: 987654321  5000    0    0    0     0          0         0 12345678    4000    0    0    0     0       0          0\n";

TEST(net_collector_reports_cumulative_counters) {
  auto root = make_root("net_dev");
  write_file(root / "proc/net/dev", kNetDev);
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  hostpulse::collectors::NetCollector c;
  std::vector<hostpulse::model::NetworkInterfaceSnapshot> out;
  ASSERT_TRUE(c.sample(out));
  ASSERT_EQ(out.size(), 2u);
  // loopback is not filtered
  ASSERT_EQ(out[0].name, std::string("lo"));
  ASSERT_EQ(out[0].received, 123456u);
  ASSERT_EQ(out[0].transmitted, 123456u);
  ASSERT_EQ(out[1].name, std::string("eth0"));
  ASSERT_EQ(out[1].received, 987654321u);
  ASSERT_EQ(out[1].transmitted, 12345678u);
}

TEST(net_collector_counters_never_reset_between_calls) {
  auto root = make_root("net_repeat");
  write_file(root / "proc/net/dev", kNetDev);
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  hostpulse::collectors::NetCollector c;
  std::vector<hostpulse::model::NetworkInterfaceSnapshot> a, b;
  ASSERT_TRUE(c.sample(a));
  ASSERT_TRUE(c.sample(b));
  ASSERT_TRUE(a == b);
}

TEST(net_collector_fails_without_proc_net_dev) {
  auto root = make_root("net_missing");
  ScopedEnv proc("HOSTPULSE_PROC_ROOT", root.string());
  std::vector<hostpulse::model::NetworkInterfaceSnapshot> out;
  ASSERT_TRUE(!hostpulse::collectors::NetCollector{}.sample(out));
}
