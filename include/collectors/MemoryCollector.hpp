#pragma once
#include "model/Memory.hpp"

namespace hostpulse::collectors {

class MemoryCollector {
public:
  bool sample(hostpulse::model::MemorySnapshot& out) const; // returns true on success
};

} // namespace hostpulse::collectors
