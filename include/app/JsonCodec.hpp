#pragma once
#include <string>
#include <vector>
#include <json/json.h>
#include "model/Snapshot.hpp"

// Wire format of every response record. Keys match what the GUI reads;
// from_json returns false when a required key is missing or mistyped.
namespace hostpulse::app {

Json::Value to_json(const hostpulse::model::SystemIdentity& v);
Json::Value to_json(const hostpulse::model::CpuSnapshot& v);
Json::Value to_json(const hostpulse::model::MemorySnapshot& v);
Json::Value to_json(const hostpulse::model::DiskSnapshot& v);
Json::Value to_json(const hostpulse::model::NetworkInterfaceSnapshot& v);
Json::Value to_json(const hostpulse::model::ProcessSnapshot& v);
Json::Value to_json(const hostpulse::model::TemperatureReading& v);
Json::Value to_json(const hostpulse::model::RealtimeStats& v);
Json::Value to_json(const hostpulse::model::AdvancedSystemInfo& v);
Json::Value to_json(const hostpulse::model::HostSnapshotBundle& v);

template <typename T>
Json::Value to_json(const std::vector<T>& items) {
  Json::Value arr(Json::arrayValue);
  for (const auto& it : items) arr.append(to_json(it));
  return arr;
}

bool from_json(const Json::Value& j, hostpulse::model::SystemIdentity& out);
bool from_json(const Json::Value& j, hostpulse::model::CpuSnapshot& out);
bool from_json(const Json::Value& j, hostpulse::model::MemorySnapshot& out);
bool from_json(const Json::Value& j, hostpulse::model::DiskSnapshot& out);
bool from_json(const Json::Value& j, hostpulse::model::NetworkInterfaceSnapshot& out);
bool from_json(const Json::Value& j, hostpulse::model::ProcessSnapshot& out);
bool from_json(const Json::Value& j, hostpulse::model::TemperatureReading& out);
bool from_json(const Json::Value& j, hostpulse::model::RealtimeStats& out);
bool from_json(const Json::Value& j, hostpulse::model::AdvancedSystemInfo& out);
bool from_json(const Json::Value& j, hostpulse::model::HostSnapshotBundle& out);

template <typename T>
bool from_json(const Json::Value& j, std::vector<T>& out) {
  if (!j.isArray()) return false;
  out.clear();
  for (const auto& e : j) {
    T item{};
    if (!from_json(e, item)) return false;
    out.push_back(std::move(item));
  }
  return true;
}

// Compact single-line rendering
std::string write_compact(const Json::Value& v);
// Parse text; false (with message in err) on malformed input
bool parse_json(const std::string& text, Json::Value& out, std::string& err);

} // namespace hostpulse::app
