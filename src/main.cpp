#include "app/Config.hpp"
#include "app/Dispatcher.hpp"
#include "app/JsonCodec.hpp"
#include "app/Telemetry.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

static void print_usage(std::ostream& os) {
  os << "Usage: hostpulse [--config PATH] [--settle-ms MS] <endpoint> [limit]\n"
        "       hostpulse [--config PATH] [--settle-ms MS] --serve\n"
        "       hostpulse --list\n"
        "\n"
        "--serve reads one JSON request per line on stdin:\n"
        "  {\"id\":1,\"cmd\":\"get_top_processes\",\"args\":{\"limit\":10}}\n"
        "and answers with one JSON line on stdout.\n";
}

static std::optional<int> parse_int(std::string_view s) {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<int> settle_ms;
  bool serve = false, list = false;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--settle-ms" && i + 1 < argc) {
      settle_ms = parse_int(argv[++i]);
      if (!settle_ms || *settle_ms < 0) { std::cerr << "hostpulse: --settle-ms expects a non-negative integer\n"; return 2; }
    }
    else if (a == "--serve") serve = true;
    else if (a == "--list") list = true;
    else if (a == "-h" || a == "--help") { print_usage(std::cout); return 0; }
    else if (!a.empty() && a[0] == '-') { std::cerr << "hostpulse: unknown option " << a << "\n"; print_usage(std::cerr); return 2; }
    else positional.push_back(a);
  }

  hostpulse::app::Config cfg = hostpulse::app::load_config(config_path);
  if (settle_ms) cfg.settle = std::chrono::milliseconds(std::min(*settle_ms, 5000));
  hostpulse::app::Telemetry telemetry(cfg);
  hostpulse::app::Dispatcher dispatcher(telemetry);

  if (list) {
    for (const auto& n : dispatcher.endpoint_names()) std::cout << n << "\n";
    return 0;
  }

  if (serve) {
    hostpulse::util::log_debug("serving requests on stdin");
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) continue;
      std::cout << dispatcher.handle_line(line) << "\n" << std::flush;
    }
    return 0;
  }

  if (positional.empty() || positional.size() > 2) { print_usage(std::cerr); return 2; }
  Json::Value args(Json::objectValue);
  if (positional.size() == 2) {
    auto limit = parse_int(positional[1]);
    if (!limit || *limit < 0) { std::cerr << "hostpulse: limit must be a non-negative integer\n"; return 2; }
    args["limit"] = *limit;
  }
  auto resp = dispatcher.call(positional[0], args);
  if (!resp.ok) {
    std::cerr << "hostpulse: " << resp.error << "\n";
    return 1;
  }
  Json::StreamWriterBuilder b;
  b["indentation"] = "  ";
  std::cout << Json::writeString(b, resp.result) << "\n";
  return 0;
}
