#pragma once
#include "model/Cpu.hpp"

namespace iorate::collectors {

// Reads the aggregate "cpu " line of /proc/stat.
class CpuCollector {
public:
  bool sample(iorate::model::CpuCounters& out);
};

} // namespace iorate::collectors
