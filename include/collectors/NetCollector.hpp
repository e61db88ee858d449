#pragma once
#include <vector>
#include "model/Net.hpp"

namespace hostpulse::collectors {

class NetCollector {
public:
  // Cumulative rx/tx byte counters per interface, /proc/net/dev order
  bool sample(std::vector<hostpulse::model::NetworkInterfaceSnapshot>& out);
};

} // namespace hostpulse::collectors
