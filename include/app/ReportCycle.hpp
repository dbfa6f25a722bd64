#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include "collectors/ISnapshotProvider.hpp"
#include "model/Snapshot.hpp"
#include "ui/Report.hpp"

namespace iorate::app {

struct CycleOptions {
  bool show_cpu{true};
  bool show_devices{true};
  bool omit_first{false};   // skip the since-boot report
  double interval_s{1.0};
  uint32_t count{0};        // 0 => run until externally terminated
  double unit_divisor{1.0};
};

enum class CycleStatus { Completed, SourceUnreadable, OutputFailed };

const char* to_string(CycleStatus s);

// Sample -> sleep -> sample -> delta -> report, for `count` reports.
// Single-threaded; the previous snapshot is replaced by move each iteration.
class ReportCycle {
public:
  using Sleeper = std::function<void(std::chrono::duration<double>)>;

  // sleeper defaults to std::this_thread::sleep_for
  ReportCycle(iorate::collectors::ISnapshotProvider& provider, iorate::ui::IReportSink& sink,
              CycleOptions opts, Sleeper sleeper = {});

  [[nodiscard]] CycleStatus run();

  [[nodiscard]] uint64_t reports_emitted() const { return emitted_; }

private:
  static constexpr uint64_t kUnbounded = std::numeric_limits<uint64_t>::max();

  bool take(iorate::model::CounterSnapshot& out);
  void emit(const iorate::model::CounterSnapshot& d, double elapsed_s);
  // true when the last report has been emitted
  bool count_down();

  iorate::collectors::ISnapshotProvider& provider_;
  iorate::ui::IReportSink& sink_;
  CycleOptions opts_;
  Sleeper sleeper_;
  iorate::model::CounterSnapshot previous_{};
  uint64_t remaining_{kUnbounded};
  uint64_t emitted_{0};
};

} // namespace iorate::app
