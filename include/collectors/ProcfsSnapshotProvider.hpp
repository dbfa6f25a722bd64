#pragma once
#include "collectors/ISnapshotProvider.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"

namespace iorate::collectors {

// Snapshot provider backed by /proc/stat and /proc/diskstats (honours IORATE_PROC_ROOT).
class ProcfsSnapshotProvider : public ISnapshotProvider {
public:
  [[nodiscard]] bool read_cpu(iorate::model::CpuCounters& out) override { return cpu_.sample(out); }
  [[nodiscard]] bool read_disks(iorate::model::DeviceMap& out) override { return disk_.sample(out); }
  [[nodiscard]] const char* name() const override { return "procfs"; }
private:
  CpuCollector cpu_{};
  DiskCollector disk_{};
};

} // namespace iorate::collectors
