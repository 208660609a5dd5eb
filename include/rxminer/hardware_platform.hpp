#pragma once

#include <cstdint>
#include <optional>

namespace rxminer {

struct CpuTimes {
  uint64_t busy = 0;
  uint64_t total = 0;
};

bool os_read_cpu_times(CpuTimes* out);
std::optional<uint64_t> os_memory_used_bytes();
std::optional<double> os_cpu_temperature_c();

} // namespace rxminer
