#pragma once
#include <string_view>

namespace iorate::engine {

// True when name looks like a partition of another block device
// (sda1, nvme0n1p2, loop0p1). Unknown naming schemes count as whole disks,
// so an odd device is reported rather than hidden.
[[nodiscard]] bool is_partition(std::string_view name);

} // namespace iorate::engine
