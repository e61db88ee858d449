#include "app/JsonCodec.hpp"
#include <memory>

namespace hostpulse::app {

using namespace hostpulse::model;

namespace {

bool get(const Json::Value& j, const char* key, std::string& out) {
  const auto& v = j[key];
  if (!v.isString()) return false;
  out = v.asString();
  return true;
}

bool get(const Json::Value& j, const char* key, uint64_t& out) {
  const auto& v = j[key];
  if (!v.isUInt64()) return false;
  out = v.asUInt64();
  return true;
}

bool get(const Json::Value& j, const char* key, int32_t& out) {
  const auto& v = j[key];
  if (!v.isInt()) return false;
  out = v.asInt();
  return true;
}

bool get(const Json::Value& j, const char* key, double& out) {
  const auto& v = j[key];
  if (!v.isDouble()) return false;
  out = v.asDouble();
  return true;
}

bool get(const Json::Value& j, const char* key, bool& out) {
  const auto& v = j[key];
  if (!v.isBool()) return false;
  out = v.asBool();
  return true;
}

Json::Value u64(uint64_t v) { return Json::Value(static_cast<Json::UInt64>(v)); }

} // anonymous namespace

Json::Value to_json(const SystemIdentity& v) {
  Json::Value j(Json::objectValue);
  j["name"] = v.name;
  j["os_version"] = v.os_version;
  j["kernel_version"] = v.kernel_version;
  j["hostname"] = v.hostname;
  j["uptime"] = u64(v.uptime);
  j["boot_time"] = u64(v.boot_time);
  return j;
}

bool from_json(const Json::Value& j, SystemIdentity& out) {
  if (!j.isObject()) return false;
  return get(j, "name", out.name) && get(j, "os_version", out.os_version)
      && get(j, "kernel_version", out.kernel_version) && get(j, "hostname", out.hostname)
      && get(j, "uptime", out.uptime) && get(j, "boot_time", out.boot_time);
}

Json::Value to_json(const CpuSnapshot& v) {
  Json::Value j(Json::objectValue);
  j["name"] = v.name;
  j["brand"] = v.brand;
  j["usage"] = v.usage;
  j["frequency"] = u64(v.frequency);
  j["cores"] = u64(v.cores);
  j["physical_cores"] = u64(v.physical_cores);
  return j;
}

bool from_json(const Json::Value& j, CpuSnapshot& out) {
  if (!j.isObject()) return false;
  return get(j, "name", out.name) && get(j, "brand", out.brand) && get(j, "usage", out.usage)
      && get(j, "frequency", out.frequency) && get(j, "cores", out.cores)
      && get(j, "physical_cores", out.physical_cores);
}

Json::Value to_json(const MemorySnapshot& v) {
  Json::Value j(Json::objectValue);
  j["total"] = u64(v.total);
  j["used"] = u64(v.used);
  j["available"] = u64(v.available);
  j["usage_percent"] = v.usage_percent;
  j["swap_total"] = u64(v.swap_total);
  j["swap_used"] = u64(v.swap_used);
  return j;
}

bool from_json(const Json::Value& j, MemorySnapshot& out) {
  if (!j.isObject()) return false;
  return get(j, "total", out.total) && get(j, "used", out.used) && get(j, "available", out.available)
      && get(j, "usage_percent", out.usage_percent) && get(j, "swap_total", out.swap_total)
      && get(j, "swap_used", out.swap_used);
}

Json::Value to_json(const DiskSnapshot& v) {
  Json::Value j(Json::objectValue);
  j["name"] = v.name;
  j["mount_point"] = v.mount_point;
  j["total_space"] = u64(v.total_space);
  j["available_space"] = u64(v.available_space);
  j["used_space"] = u64(v.used_space);
  j["usage_percent"] = v.usage_percent;
  j["file_system"] = v.file_system;
  return j;
}

bool from_json(const Json::Value& j, DiskSnapshot& out) {
  if (!j.isObject()) return false;
  return get(j, "name", out.name) && get(j, "mount_point", out.mount_point)
      && get(j, "total_space", out.total_space) && get(j, "available_space", out.available_space)
      && get(j, "used_space", out.used_space) && get(j, "usage_percent", out.usage_percent)
      && get(j, "file_system", out.file_system);
}

Json::Value to_json(const NetworkInterfaceSnapshot& v) {
  Json::Value j(Json::objectValue);
  j["name"] = v.name;
  j["received"] = u64(v.received);
  j["transmitted"] = u64(v.transmitted);
  return j;
}

bool from_json(const Json::Value& j, NetworkInterfaceSnapshot& out) {
  if (!j.isObject()) return false;
  return get(j, "name", out.name) && get(j, "received", out.received)
      && get(j, "transmitted", out.transmitted);
}

Json::Value to_json(const ProcessSnapshot& v) {
  Json::Value j(Json::objectValue);
  j["name"] = v.name;
  j["pid"] = v.pid;
  j["cpu_usage"] = v.cpu_usage;
  j["memory"] = u64(v.memory);
  j["gpu_usage"] = v.gpu_usage;
  return j;
}

bool from_json(const Json::Value& j, ProcessSnapshot& out) {
  if (!j.isObject()) return false;
  return get(j, "name", out.name) && get(j, "pid", out.pid) && get(j, "cpu_usage", out.cpu_usage)
      && get(j, "memory", out.memory) && get(j, "gpu_usage", out.gpu_usage);
}

Json::Value to_json(const TemperatureReading& v) {
  Json::Value j(Json::objectValue);
  j["component"] = v.component;
  j["temperature"] = v.temperature;
  if (v.max_temperature) j["max_temperature"] = *v.max_temperature;
  if (v.critical_temperature) j["critical_temperature"] = *v.critical_temperature;
  j["synthetic"] = v.synthetic;
  return j;
}

bool from_json(const Json::Value& j, TemperatureReading& out) {
  if (!j.isObject()) return false;
  if (!get(j, "component", out.component) || !get(j, "temperature", out.temperature)) return false;
  out.max_temperature.reset();
  out.critical_temperature.reset();
  double d = 0.0;
  if (j.isMember("max_temperature")) {
    if (!get(j, "max_temperature", d)) return false;
    out.max_temperature = d;
  }
  if (j.isMember("critical_temperature")) {
    if (!get(j, "critical_temperature", d)) return false;
    out.critical_temperature = d;
  }
  // absent in payloads from older producers: those were always placeholders
  out.synthetic = true;
  if (j.isMember("synthetic") && !get(j, "synthetic", out.synthetic)) return false;
  return true;
}

static void put_stats(Json::Value& j, const RealtimeStats& v) {
  j["cpu_usage"] = v.cpu_usage;
  j["memory_usage"] = v.memory_usage;
  j["memory_used_gb"] = v.memory_used_gb;
  j["memory_total_gb"] = v.memory_total_gb;
}

Json::Value to_json(const RealtimeStats& v) {
  Json::Value j(Json::objectValue);
  put_stats(j, v);
  return j;
}

bool from_json(const Json::Value& j, RealtimeStats& out) {
  if (!j.isObject()) return false;
  return get(j, "cpu_usage", out.cpu_usage) && get(j, "memory_usage", out.memory_usage)
      && get(j, "memory_used_gb", out.memory_used_gb) && get(j, "memory_total_gb", out.memory_total_gb);
}

Json::Value to_json(const AdvancedSystemInfo& v) {
  Json::Value j(Json::objectValue);
  j["process_count"] = u64(v.process_count);
  j["total_processes"] = u64(v.total_processes);
  Json::Value load(Json::arrayValue);
  for (double d : v.load_average) load.append(d);
  j["load_average"] = load;
  j["users_count"] = u64(v.users_count);
  return j;
}

bool from_json(const Json::Value& j, AdvancedSystemInfo& out) {
  if (!j.isObject()) return false;
  if (!get(j, "process_count", out.process_count) || !get(j, "total_processes", out.total_processes)
      || !get(j, "users_count", out.users_count)) return false;
  const auto& load = j["load_average"];
  if (!load.isArray() || load.size() != 3) return false;
  for (Json::ArrayIndex i = 0; i < 3; ++i) {
    if (!load[i].isDouble()) return false;
    out.load_average[i] = load[i].asDouble();
  }
  return true;
}

Json::Value to_json(const HostSnapshotBundle& v) {
  Json::Value j(Json::objectValue);
  put_stats(j, v.stats);
  j["temperatures"] = to_json(v.temperatures);
  Json::Value net(Json::objectValue);
  for (const auto& [name, counters] : v.network_activity) {
    Json::Value pair(Json::arrayValue);
    pair.append(u64(counters.first));
    pair.append(u64(counters.second));
    net[name] = pair;
  }
  j["network_activity"] = net;
  j["top_processes"] = to_json(v.top_processes);
  j["timestamp"] = v.timestamp;
  return j;
}

bool from_json(const Json::Value& j, HostSnapshotBundle& out) {
  if (!j.isObject()) return false;
  if (!from_json(j, out.stats)) return false;
  if (!from_json(j["temperatures"], out.temperatures)) return false;
  if (!from_json(j["top_processes"], out.top_processes)) return false;
  if (!get(j, "timestamp", out.timestamp)) return false;
  const auto& net = j["network_activity"];
  if (!net.isObject()) return false;
  out.network_activity.clear();
  for (const auto& name : net.getMemberNames()) {
    const auto& pair = net[name];
    if (!pair.isArray() || pair.size() != 2 || !pair[0].isUInt64() || !pair[1].isUInt64()) return false;
    out.network_activity[name] = {pair[0].asUInt64(), pair[1].asUInt64()};
  }
  return true;
}

std::string write_compact(const Json::Value& v) {
  Json::StreamWriterBuilder b;
  b["indentation"] = "";
  return Json::writeString(b, v);
}

bool parse_json(const std::string& text, Json::Value& out, std::string& err) {
  Json::CharReaderBuilder b;
  std::unique_ptr<Json::CharReader> reader(b.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), &out, &err);
}

} // namespace hostpulse::app
