#include "app/Dispatcher.hpp"
#include "app/JsonCodec.hpp"
#include "util/Log.hpp"
#include <stdexcept>

namespace hostpulse::app {

// Bad request arguments; reported like any other failure
struct ArgumentError : public std::runtime_error { using std::runtime_error::runtime_error; };

Dispatcher::Dispatcher(const Telemetry& telemetry) : telemetry_(telemetry) {
  endpoints_ = {
    {"get_system_info", [this](const Json::Value&){ return to_json(telemetry_.system_identity()); }},
    {"get_cpu_info", [this](const Json::Value&){ return to_json(telemetry_.cpu_snapshot()); }},
    {"get_memory_info", [this](const Json::Value&){ return to_json(telemetry_.memory_snapshot()); }},
    {"get_disk_info", [this](const Json::Value&){ return to_json(telemetry_.disk_snapshots()); }},
    {"get_network_info", [this](const Json::Value&){ return to_json(telemetry_.network_snapshots()); }},
    {"get_real_time_stats", [this](const Json::Value&){ return to_json(telemetry_.realtime_stats()); }},
    {"get_top_processes", [this](const Json::Value& a){
       return to_json(telemetry_.top_processes(limit_arg(a, telemetry_.config().top_limit))); }},
    {"get_temperatures", [this](const Json::Value&){ return to_json(telemetry_.temperatures()); }},
    {"get_advanced_system_info", [this](const Json::Value&){ return to_json(telemetry_.advanced_info()); }},
    {"get_extended_realtime_stats", [this](const Json::Value&){ return to_json(telemetry_.extended_snapshot()); }},
  };
}

size_t Dispatcher::limit_arg(const Json::Value& args, int def) const {
  if (!args.isObject() || !args.isMember("limit")) return static_cast<size_t>(def);
  const auto& v = args["limit"];
  if (!v.isUInt()) throw ArgumentError("limit must be a non-negative integer");
  return static_cast<size_t>(v.asUInt());
}

std::vector<std::string> Dispatcher::endpoint_names() const {
  std::vector<std::string> out;
  for (const auto& e : endpoints_) out.push_back(e.name);
  return out;
}

Response Dispatcher::call(const std::string& name, const Json::Value& args) const {
  Response r;
  for (const auto& e : endpoints_) {
    if (e.name != name) continue;
    try {
      r.result = e.fn(args);
      r.ok = true;
    } catch (const std::exception& ex) {
      r.ok = false;
      r.error = ex.what();
      hostpulse::util::log_error("%s failed: %s", name.c_str(), ex.what());
    }
    return r;
  }
  r.error = "unknown endpoint: " + name;
  return r;
}

std::string Dispatcher::handle_line(const std::string& line) const {
  Json::Value req;
  std::string err;
  Json::Value out(Json::objectValue);
  if (!parse_json(line, req, err) || !req.isObject()) {
    out["id"] = Json::Value();
    out["ok"] = false;
    out["error"] = err.empty() ? std::string("request must be a JSON object") : "malformed request: " + err;
    return write_compact(out);
  }
  out["id"] = req.isMember("id") ? req["id"] : Json::Value();
  const auto& cmd = req["cmd"];
  if (!cmd.isString()) {
    out["ok"] = false;
    out["error"] = "missing cmd";
    return write_compact(out);
  }
  Json::Value args = req.isMember("args") ? req["args"] : Json::Value(Json::objectValue);
  Response r = call(cmd.asString(), args);
  out["ok"] = r.ok;
  if (r.ok) out["result"] = std::move(r.result);
  else out["error"] = r.error;
  return write_compact(out);
}

} // namespace hostpulse::app
