#include "minitest.hpp"
#include "app/JsonCodec.hpp"
#include "app/SnapshotBuilder.hpp"
#include "collectors/DiskCollector.hpp"

using namespace hostpulse::app;
using namespace hostpulse::model;

static HostSnapshotBundle sample_bundle() {
  HostSnapshotBundle b;
  b.stats = {42.5, 61.25, 9.8, 16.0};
  b.temperatures = estimate_temperatures(42.5);
  b.network_activity["eth0"] = {123456789012ull, 42ull};
  b.network_activity["lo"] = {7, 7};
  ProcessSnapshot p;
  p.name = "chrome"; p.pid = 4242; p.cpu_usage = 12.5; p.memory = 734003200; p.gpu_usage = 3.75;
  b.top_processes.push_back(p);
  b.timestamp = "2024-05-01T12:00:00.123Z";
  return b;
}

TEST(json_bundle_flattens_stats_and_round_trips) {
  auto b = sample_bundle();
  Json::Value j = to_json(b);
  ASSERT_TRUE(j.isMember("cpu_usage"));
  ASSERT_TRUE(j.isMember("memory_total_gb"));
  ASSERT_TRUE(!j.isMember("stats"));
  ASSERT_TRUE(j["network_activity"]["eth0"].isArray());
  ASSERT_EQ(j["network_activity"]["eth0"][0].asUInt64(), 123456789012ull);

  Json::Value parsed;
  std::string err;
  ASSERT_TRUE(parse_json(write_compact(j), parsed, err));
  HostSnapshotBundle back;
  ASSERT_TRUE(from_json(parsed, back));
  ASSERT_TRUE(back == b);
}

TEST(json_temperature_optional_fields_omitted) {
  TemperatureReading t;
  t.component = "System";
  t.temperature = 35.0;
  Json::Value j = to_json(t);
  ASSERT_TRUE(!j.isMember("max_temperature"));
  ASSERT_TRUE(!j.isMember("critical_temperature"));
  ASSERT_EQ(j["synthetic"].asBool(), true);

  TemperatureReading back;
  back.max_temperature = 1.0;
  ASSERT_TRUE(from_json(j, back));
  ASSERT_TRUE(!back.max_temperature.has_value());
  ASSERT_TRUE(back == t);
}

TEST(json_temperature_without_synthetic_flag_is_placeholder) {
  Json::Value j;
  std::string err;
  ASSERT_TRUE(parse_json("{\"component\":\"CPU Package\",\"temperature\":45,\"max_temperature\":100}", j, err));
  TemperatureReading t;
  t.synthetic = false;
  ASSERT_TRUE(from_json(j, t));
  ASSERT_TRUE(t.synthetic);
  ASSERT_NEAR(t.temperature, 45.0, 1e-9);
  ASSERT_NEAR(*t.max_temperature, 100.0, 1e-9);
}

TEST(json_missing_required_key_rejected) {
  MemorySnapshot m;
  m.total = 100; m.used = 40; m.available = 60; m.usage_percent = 40.0;
  Json::Value j = to_json(m);
  j.removeMember("available");
  MemorySnapshot back;
  ASSERT_TRUE(!from_json(j, back));

  Json::Value wrong = to_json(m);
  wrong["total"] = "a lot";
  ASSERT_TRUE(!from_json(wrong, back));
  ASSERT_TRUE(!from_json(Json::Value(Json::arrayValue), back));
}

TEST(json_record_key_names) {
  CpuSnapshot c;
  c.name = "GenuineIntel"; c.brand = "Intel(R) Core(TM) i7"; c.usage = 10.0;
  c.frequency = 3600; c.cores = 8; c.physical_cores = 4;
  Json::Value j = to_json(c);
  for (const char* k : {"name", "brand", "usage", "frequency", "cores", "physical_cores"})
    ASSERT_TRUE(j.isMember(k));

  DiskSnapshot d;
  Json::Value dj = to_json(d);
  for (const char* k : {"name", "mount_point", "total_space", "available_space", "used_space", "usage_percent", "file_system"})
    ASSERT_TRUE(dj.isMember(k));

  SystemIdentity id;
  Json::Value ij = to_json(id);
  for (const char* k : {"name", "os_version", "kernel_version", "hostname", "uptime", "boot_time"})
    ASSERT_TRUE(ij.isMember(k));

  auto a = make_advanced_info(3, {0.1, 0.2, 0.3});
  Json::Value aj = to_json(a);
  ASSERT_EQ(aj["load_average"].size(), 3u);
  ASSERT_EQ(aj["users_count"].asUInt64(), 1u);
}

TEST(json_vector_of_records) {
  std::vector<NetworkInterfaceSnapshot> ifs = {{"lo", 1, 2}, {"wlan0", 300, 400}};
  Json::Value j = to_json(ifs);
  ASSERT_TRUE(j.isArray());
  ASSERT_EQ(j.size(), 2u);
  std::vector<NetworkInterfaceSnapshot> back;
  ASSERT_TRUE(from_json(j, back));
  ASSERT_TRUE(back == ifs);
}

TEST(json_parse_reports_malformed_text) {
  Json::Value j;
  std::string err;
  ASSERT_TRUE(!parse_json("{\"cmd\": ", j, err));
  ASSERT_TRUE(!err.empty());
}

TEST(json_compact_is_single_line) {
  auto s = write_compact(to_json(sample_bundle()));
  ASSERT_TRUE(s.find('\n') == std::string::npos);
}

// to_json -> text -> from_json yields an equal record
template <typename T>
static bool survives_wire(const T& rec) {
  Json::Value parsed;
  std::string err;
  if (!parse_json(write_compact(to_json(rec)), parsed, err)) return false;
  T back{};
  return from_json(parsed, back) && back == rec;
}

TEST(json_every_record_round_trips) {
  SystemIdentity id;
  id.name = "Debian GNU/Linux"; id.os_version = "12"; id.kernel_version = "6.1.0-18-amd64";
  id.hostname = "rack-04"; id.uptime = 864000; id.boot_time = 1714000000;
  ASSERT_TRUE(survives_wire(id));

  CpuSnapshot c;
  c.name = "AuthenticAMD"; c.brand = "AMD Ryzen 9 7950X 16-Core Processor"; c.usage = 13.37;
  c.frequency = 4500; c.cores = 32; c.physical_cores = 16;
  ASSERT_TRUE(survives_wire(c));

  MemorySnapshot m;
  m.total = 68719476736ull; m.used = 12884901888ull; m.available = m.total - m.used;
  m.usage_percent = 18.75; m.swap_total = 8589934592ull; m.swap_used = 1024;
  ASSERT_TRUE(survives_wire(m));

  auto d = hostpulse::collectors::make_disk_snapshot("/dev/nvme0n1p2", "/home", "btrfs",
                                                     2000398934016ull, 734003200000ull);
  ASSERT_TRUE(survives_wire(d));

  auto a = make_advanced_info(418, {2.35, 1.9, 1.42});
  ASSERT_TRUE(survives_wire(a));

  RealtimeStats st = make_realtime_stats(71.3, m);
  ASSERT_TRUE(survives_wire(st));
}

TEST(json_non_ascii_names_round_trip) {
  ProcessSnapshot p;
  p.name = "caf\xC3\xA9-srv"; p.pid = 9; p.cpu_usage = 1.5; p.memory = 4096; p.gpu_usage = 0.075;
  ASSERT_TRUE(survives_wire(p));
  TemperatureReading t;
  t.component = "Capteur \xE2\x84\x96" "1"; t.temperature = 40.5; t.synthetic = false;
  ASSERT_TRUE(survives_wire(t));
}
