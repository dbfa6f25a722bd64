#pragma once
#include "model/Snapshot.hpp"

namespace iorate::engine {

// /proc/diskstats always counts in 512-byte sectors regardless of the device's block size
inline constexpr double kSectorBytes = 512.0;

enum class Unit { Kilobytes, Megabytes };

// 1 for kB/s, 1024 for MB/s
double unit_divisor(Unit u);
// "kB" or "MB", used in column headers
const char* unit_label(Unit u);

// All six values are 0 when the interval saw no ticks at all.
model::CpuPercentages cpu_percentages(const model::CpuCounters& d);

// d is a delta (or the raw counters for the since-boot report with elapsed_s = 1.0).
// A non-positive elapsed_s is treated as one second.
model::DeviceRates device_rates(const model::DiskCounters& d, double elapsed_s, double unit_div);

} // namespace iorate::engine
