#include "rxminer/hardware_platform.hpp"

namespace rxminer {

bool os_read_cpu_times(CpuTimes*) {
  return false;
}

std::optional<uint64_t> os_memory_used_bytes() {
  return std::nullopt;
}

std::optional<double> os_cpu_temperature_c() {
  return std::nullopt;
}

} // namespace rxminer
