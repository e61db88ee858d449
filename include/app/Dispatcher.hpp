#pragma once
#include <functional>
#include <string>
#include <vector>
#include <json/json.h>
#include "app/Telemetry.hpp"

namespace hostpulse::app {

struct Response {
  bool ok{false};
  Json::Value result;  // valid when ok
  std::string error;   // valid when !ok
};

// Maps endpoint names (get_cpu_info, ...) to Telemetry operations. This is
// the only place exceptions are turned into error strings.
class Dispatcher {
public:
  explicit Dispatcher(const Telemetry& telemetry);
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  [[nodiscard]] Response call(const std::string& name, const Json::Value& args = Json::Value(Json::objectValue)) const;

  // One request line {"id":..,"cmd":"..","args":{..}} -> one response line
  [[nodiscard]] std::string handle_line(const std::string& line) const;

  [[nodiscard]] std::vector<std::string> endpoint_names() const;

private:
  using Handler = std::function<Json::Value(const Json::Value& args)>;
  struct Endpoint { std::string name; Handler fn; };
  [[nodiscard]] size_t limit_arg(const Json::Value& args, int def) const;

  const Telemetry& telemetry_;
  std::vector<Endpoint> endpoints_;
};

} // namespace hostpulse::app
