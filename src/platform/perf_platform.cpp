#include "rxminer/perf_platform.hpp"

namespace rxminer {

bool os_build_affinity_plan(AffinityPlanData*) {
  return false;
}

bool os_pin_current_thread(const AffinitySlot&) {
  return false;
}

bool os_bind_current_thread_numa(uint32_t) {
  return false;
}

bool os_lower_mining_thread_priority() {
  return false;
}

bool os_thread_pinning_supported() {
  return false;
}

bool os_numa_binding_supported() {
  return false;
}

bool os_can_detect_huge_pages_configuration() {
  return false;
}

bool os_huge_pages_configured() {
  return false;
}

bool os_numa_detected() {
  return false;
}

const char* os_platform_name() {
  return "generic";
}

} // namespace rxminer
