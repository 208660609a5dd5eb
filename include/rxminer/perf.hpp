#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rxminer {

struct ThreadPlacement {
  bool pin = false;
  bool numa_bind = false;
  bool batch_priority = false;
};

struct PlacementResult {
  bool pinned = false;
  bool numa_bound = false;
  bool priority_lowered = false;
  uint32_t os_cpu = 0;
};

uint32_t logical_cpu_count();
uint32_t physical_cpu_count();
uint32_t recommended_mining_threads();
std::string cpu_runtime_summary();
std::string affinity_profile_summary(uint32_t worker_count, size_t max_workers = 8);

// Applies the requested placement to the calling worker thread.
PlacementResult place_current_thread(uint32_t worker_index, uint32_t worker_count, const ThreadPlacement& placement);

bool thread_pinning_supported();
bool numa_binding_supported();
bool can_detect_huge_pages_configuration();
bool huge_pages_configured();
bool numa_detected();
std::string platform_tuning_summary();

} // namespace rxminer
