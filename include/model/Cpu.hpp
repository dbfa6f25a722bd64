#pragma once
#include <cstdint>

namespace iorate::model {

// Aggregate CPU time accounting from the "cpu " line of /proc/stat (clock ticks).
// Every field is cumulative since boot.
struct CpuCounters {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
};

// Share of a sampled interval spent in each category, 0..100
struct CpuPercentages {
  double user{};   // user + nice
  double system{};
  double iowait{};
  double steal{};
  double idle{};
  double irq{};    // irq + softirq
};

} // namespace iorate::model
