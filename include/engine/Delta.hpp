#pragma once
#include <cstdint>
#include "model/Snapshot.hpp"

namespace iorate::engine {

// max(cur - prev, 0) without unsigned wraparound. A counter reset between
// samples shows up as a zero delta for that interval.
constexpr uint64_t saturating_sub(uint64_t cur, uint64_t prev) {
  return cur > prev ? cur - prev : 0;
}

model::CpuCounters delta(const model::CpuCounters& cur, const model::CpuCounters& prev);

// Cumulative group is saturating-subtracted; gauges carry cur as-is.
model::DiskCounters delta(const model::DiskCounters& cur, const model::DiskCounters& prev);

// Pairs devices by name. A device missing from either side is left out.
model::DeviceMap delta(const model::DeviceMap& cur, const model::DeviceMap& prev);

model::CounterSnapshot delta(const model::CounterSnapshot& cur, const model::CounterSnapshot& prev);

} // namespace iorate::engine
