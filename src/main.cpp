#include "app/ReportCycle.hpp"
#include "collectors/ProcfsSnapshotProvider.hpp"
#include "ui/Config.hpp"
#include "ui/Report.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  // Defaults: compiled -> config.toml -> IORATE_* environment; the command line wins over all
  iorate::ui::Options opts = iorate::ui::load_defaults();
  std::string err;
  switch (iorate::ui::parse_args(argc, argv, opts, err)) {
    case iorate::ui::ParseStatus::Help:
      std::cout << iorate::ui::usage();
      return 0;
    case iorate::ui::ParseStatus::Error:
      iorate::util::log_error("main", "%s", err.c_str());
      std::fputs(iorate::ui::usage(), stderr);
      return 2;
    case iorate::ui::ParseStatus::Run:
      break;
  }

  iorate::collectors::ProcfsSnapshotProvider provider;
  iorate::ui::ReportWriter writer(std::cout, opts.extended, opts.unit);
  iorate::app::ReportCycle cycle(provider, writer, iorate::ui::to_cycle_options(opts));

  auto status = cycle.run();
  if (status != iorate::app::CycleStatus::Completed) {
    iorate::util::log_error("main", "stopped after %llu reports: %s",
                            static_cast<unsigned long long>(cycle.reports_emitted()),
                            iorate::app::to_string(status));
    return 1;
  }
  return 0;
}
