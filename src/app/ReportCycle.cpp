#include "app/ReportCycle.hpp"
#include "engine/Delta.hpp"
#include "engine/Metrics.hpp"
#include "util/Log.hpp"
#include <thread>
#include <utility>
#include <vector>

namespace iorate::app {

const char* to_string(CycleStatus s) {
  switch (s) {
    case CycleStatus::Completed: return "completed";
    case CycleStatus::SourceUnreadable: return "counter source unreadable";
    case CycleStatus::OutputFailed: return "output failed";
  }
  return "unknown";
}

ReportCycle::ReportCycle(iorate::collectors::ISnapshotProvider& provider, iorate::ui::IReportSink& sink,
                         CycleOptions opts, Sleeper sleeper)
    : provider_(provider), sink_(sink), opts_(opts), sleeper_(std::move(sleeper)) {
  if (!sleeper_) sleeper_ = [](std::chrono::duration<double> d){ std::this_thread::sleep_for(d); };
  if (opts_.interval_s <= 0.0) opts_.interval_s = 1.0;
  if (opts_.count > 0) remaining_ = opts_.count;
}

bool ReportCycle::take(iorate::model::CounterSnapshot& out) {
  if (!provider_.read_cpu(out.cpu)) return false;
  if (!provider_.read_disks(out.disks)) return false;
  return true;
}

void ReportCycle::emit(const iorate::model::CounterSnapshot& d, double elapsed_s) {
  if (opts_.show_cpu) sink_.cpu(iorate::engine::cpu_percentages(d.cpu));
  if (opts_.show_devices) {
    std::vector<iorate::ui::DeviceReportRow> rows;
    rows.reserve(d.disks.size());
    for (const auto& [name, counters] : d.disks) {
      rows.push_back({name, iorate::engine::device_rates(counters, elapsed_s, opts_.unit_divisor)});
    }
    sink_.devices(rows);
  }
  ++emitted_;
}

bool ReportCycle::count_down() {
  if (remaining_ == kUnbounded) return false;
  if (remaining_ > 0) --remaining_;
  return remaining_ == 0;
}

CycleStatus ReportCycle::run() {
  iorate::util::log_debug("ReportCycle", "provider=%s interval=%.3fs count=%u omit_first=%d",
                          provider_.name(), opts_.interval_s, opts_.count, opts_.omit_first ? 1 : 0);
  if (!take(previous_)) return CycleStatus::SourceUnreadable;

  if (!opts_.omit_first) {
    // Since boot: the raw counters are the delta against an all-zero baseline,
    // reported over a nominal one-second interval.
    emit(previous_, 1.0);
    if (!sink_.ok()) return CycleStatus::OutputFailed;
    if (count_down()) return CycleStatus::Completed;
  }

  const auto interval = std::chrono::duration<double>(opts_.interval_s);
  for (;;) {
    sleeper_(interval);
    iorate::model::CounterSnapshot current;
    if (!take(current)) return CycleStatus::SourceUnreadable;
    emit(iorate::engine::delta(current, previous_), opts_.interval_s);
    if (!sink_.ok()) return CycleStatus::OutputFailed;
    previous_ = std::move(current);
    if (count_down()) return CycleStatus::Completed;
  }
}

} // namespace iorate::app
