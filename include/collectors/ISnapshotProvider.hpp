#pragma once
#include "model/Snapshot.hpp"

namespace iorate::collectors {

// Source of raw counter readings, so the report cycle can run against
// procfs or a scripted fake.
class ISnapshotProvider {
public:
  virtual ~ISnapshotProvider() = default;

  // Aggregate CPU counters. Return false if the source cannot be read.
  [[nodiscard]] virtual bool read_cpu(iorate::model::CpuCounters& out) = 0;

  // Whole-disk devices only (partitions already filtered). Return false if the source cannot be read.
  [[nodiscard]] virtual bool read_disks(iorate::model::DeviceMap& out) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace iorate::collectors
