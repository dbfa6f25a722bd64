#pragma once
#include "model/Cpu.hpp"
#include "model/Disk.hpp"

namespace iorate::model {

// One point-in-time reading of both counter sources. A delta between two
// snapshots has the same shape.
struct CounterSnapshot {
  CpuCounters cpu{};
  DeviceMap disks;
};

} // namespace iorate::model
