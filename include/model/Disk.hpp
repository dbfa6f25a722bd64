#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace iorate::model {

// Counters from /proc/diskstats that only grow while the device stays up.
struct DiskCumulative {
  uint64_t reads_completed{};
  uint64_t reads_merged{};
  uint64_t sectors_read{};
  uint64_t read_time_ms{};
  uint64_t writes_completed{};
  uint64_t writes_merged{};
  uint64_t sectors_written{};
  uint64_t write_time_ms{};
  uint64_t io_time_ms{};
  uint64_t weighted_io_time_ms{};
};

// Instantaneous levels at sampling time. Never subtracted across samples.
struct DiskGauges {
  uint64_t io_in_progress{};
};

struct DiskCounters {
  DiskCumulative cumulative{};
  DiskGauges gauges{};
};

// Whole-disk devices keyed by kernel name (sda, nvme0n1, ...)
using DeviceMap = std::map<std::string, DiskCounters>;

struct DeviceRates {
  double reads_per_s{};
  double writes_per_s{};
  double tps{};
  double read_per_s{};      // kB/s or MB/s depending on unit divisor
  double written_per_s{};
  // extended
  double read_merged_per_s{};
  double write_merged_per_s{};
  double await_ms{};
  double svctm_ms{};
  double util_pct{};        // clamped to 100
};

} // namespace iorate::model
