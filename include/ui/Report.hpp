#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "engine/Metrics.hpp"
#include "model/Cpu.hpp"
#include "model/Disk.hpp"

namespace iorate::ui {

struct DeviceReportRow {
  std::string name;
  iorate::model::DeviceRates rates;
};

// Receives derived values for one report iteration.
class IReportSink {
public:
  virtual ~IReportSink() = default;
  virtual void cpu(const iorate::model::CpuPercentages& p) = 0;
  // rows are sorted by device name
  virtual void devices(const std::vector<DeviceReportRow>& rows) = 0;
  // false once output can no longer be written
  [[nodiscard]] virtual bool ok() const { return true; }
};

// Fixed-width text tables:
//
//   avg-cpu:
//    %user   %sys %iowait %steal  %idle   %irq
//     3.10   1.02   0.25   0.00  95.63   0.00
//
//   Device:
//   Device            tps  kB_read/s  kB_wrtn/s
//   sda             12.00     340.00     128.50
class ReportWriter : public IReportSink {
public:
  ReportWriter(std::ostream& out, bool extended, iorate::engine::Unit unit);
  void cpu(const iorate::model::CpuPercentages& p) override;
  void devices(const std::vector<DeviceReportRow>& rows) override;
  [[nodiscard]] bool ok() const override { return static_cast<bool>(out_); }
private:
  void line(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
  std::ostream& out_;
  bool extended_;
  iorate::engine::Unit unit_;
};

} // namespace iorate::ui
