#include "rxminer/perf.hpp"

#include "rxminer/perf_platform.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <utility>

#ifdef RXMINER_HAVE_HWLOC
#include <hwloc.h>
#endif

namespace rxminer {

namespace {

std::once_flag g_affinity_plan_once;
AffinityPlanData g_affinity_plan;

uint32_t hardware_concurrency() {
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1U : hw;
}

// Spread workers over physical cores first, SMT siblings last.
void order_slots(std::vector<AffinitySlot>* slots) {
  std::sort(slots->begin(), slots->end(), [](const AffinitySlot& a, const AffinitySlot& b) {
    return std::tie(a.performance_tier, a.sibling_index, a.package_id, a.core_id, a.os_cpu) <
           std::tie(b.performance_tier, b.sibling_index, b.package_id, b.core_id, b.os_cpu);
  });
}

void complete_plan(AffinityPlanData* plan) {
  if (plan->slots.empty()) {
    const uint32_t logical = hardware_concurrency();
    plan->source = "fallback";
    for (uint32_t i = 0; i < logical; ++i) {
      AffinitySlot slot;
      slot.os_cpu = i;
      slot.core_id = i;
      plan->slots.push_back(slot);
    }
    plan->logical_cpus = logical;
    plan->physical_cores = logical;
  }

  order_slots(&plan->slots);

  if (plan->logical_cpus == 0) {
    plan->logical_cpus = static_cast<uint32_t>(plan->slots.size());
  }
  if (plan->physical_cores == 0) {
    std::set<std::pair<uint32_t, uint32_t>> cores;
    for (const auto& slot : plan->slots) {
      cores.emplace(slot.package_id, slot.core_id);
    }
    plan->physical_cores = static_cast<uint32_t>(cores.size());
  }
}

#ifdef RXMINER_HAVE_HWLOC
uint32_t hwloc_performance_tier(hwloc_obj_t obj) {
  if (obj == nullptr) {
    return 0;
  }
  for (unsigned i = 0; i < obj->infos_count; ++i) {
    if (obj->infos[i].name == nullptr || obj->infos[i].value == nullptr) {
      continue;
    }
    std::string key(obj->infos[i].name);
    std::string value(obj->infos[i].value);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key.find("coretype") == std::string::npos) {
      continue;
    }
    if (value.find("atom") != std::string::npos || value.find("eff") != std::string::npos) {
      return 1;
    }
  }
  return 0;
}

bool build_plan_hwloc(AffinityPlanData* plan) {
  hwloc_topology_t topology = nullptr;
  if (hwloc_topology_init(&topology) != 0 || topology == nullptr) {
    return false;
  }
  if (hwloc_topology_load(topology) != 0) {
    hwloc_topology_destroy(topology);
    return false;
  }

  const int pu_count = hwloc_get_nbobjs_by_type(topology, HWLOC_OBJ_PU);
  std::map<std::pair<uint32_t, uint32_t>, uint32_t> siblings;
  for (int i = 0; i < pu_count; ++i) {
    hwloc_obj_t pu = hwloc_get_obj_by_type(topology, HWLOC_OBJ_PU, static_cast<unsigned>(i));
    if (pu == nullptr) {
      continue;
    }
    hwloc_obj_t core = hwloc_get_ancestor_obj_by_type(topology, HWLOC_OBJ_CORE, pu);
    hwloc_obj_t package = hwloc_get_ancestor_obj_by_type(topology, HWLOC_OBJ_PACKAGE, pu);

    AffinitySlot slot;
    slot.os_cpu = pu->os_index == static_cast<unsigned>(-1) ? static_cast<uint32_t>(i) : pu->os_index;
    slot.core_id = core == nullptr ? slot.os_cpu : core->logical_index;
    slot.package_id = package == nullptr ? 0U : package->logical_index;
    slot.performance_tier = hwloc_performance_tier(core != nullptr ? core : pu);
    slot.sibling_index = siblings[{slot.package_id, slot.core_id}]++;
    plan->slots.push_back(slot);
  }

  hwloc_topology_destroy(topology);
  plan->source = "hwloc";
  plan->logical_cpus = static_cast<uint32_t>(plan->slots.size());
  plan->physical_cores = static_cast<uint32_t>(siblings.size());
  return !plan->slots.empty();
}
#endif

const AffinityPlanData& affinity_plan() {
  std::call_once(g_affinity_plan_once, []() {
    AffinityPlanData plan;
    bool built = false;
#ifdef RXMINER_HAVE_HWLOC
    built = build_plan_hwloc(&plan);
#endif
    if (!built) {
      plan = AffinityPlanData{};
      built = os_build_affinity_plan(&plan);
    }
    if (!built) {
      plan = AffinityPlanData{};
    }
    complete_plan(&plan);
    g_affinity_plan = std::move(plan);
  });
  return g_affinity_plan;
}

} // namespace

uint32_t logical_cpu_count() {
  return affinity_plan().logical_cpus;
}

uint32_t physical_cpu_count() {
  return affinity_plan().physical_cores;
}

uint32_t recommended_mining_threads() {
  const uint32_t logical = logical_cpu_count();
  const uint32_t physical = physical_cpu_count();
  if (physical == 0 || physical > logical) {
    return logical;
  }
  return std::max<uint32_t>(1U, physical);
}

std::string cpu_runtime_summary() {
  const char* arch = "unknown";
#if defined(__x86_64__)
  arch = "x86_64";
#elif defined(__aarch64__)
  arch = "arm64";
#elif defined(__i386__)
  arch = "x86";
#endif
  std::ostringstream out;
  out << "arch=" << arch
      << " physical=" << physical_cpu_count()
      << " logical=" << logical_cpu_count()
      << " recommended_threads=" << recommended_mining_threads()
      << " affinity_source=" << affinity_plan().source;
  return out.str();
}

std::string affinity_profile_summary(uint32_t worker_count, size_t max_workers) {
  const auto& plan = affinity_plan();
  const uint32_t workers = worker_count == 0 ? recommended_mining_threads() : worker_count;
  const size_t preview = std::min<size_t>(max_workers, workers);

  std::ostringstream out;
  out << "source=" << plan.source << " mapping=";
  for (size_t i = 0; i < preview; ++i) {
    const auto& slot = plan.slots[i % plan.slots.size()];
    out << (i > 0 ? " " : "") << 'w' << i << "->cpu" << slot.os_cpu;
    if (slot.sibling_index > 0) {
      out << "(smt)";
    }
  }
  if (workers > preview) {
    out << " ...";
  }
  return out.str();
}

PlacementResult place_current_thread(uint32_t worker_index, uint32_t worker_count, const ThreadPlacement& placement) {
  (void)worker_count;
  PlacementResult result;
  const auto& plan = affinity_plan();
  const auto& slot = plan.slots[worker_index % plan.slots.size()];
  result.os_cpu = slot.os_cpu;

  if (placement.batch_priority) {
    result.priority_lowered = os_lower_mining_thread_priority();
  }
  if (placement.pin) {
    result.pinned = os_pin_current_thread(slot);
  }
  if (placement.numa_bind) {
    result.numa_bound = os_bind_current_thread_numa(worker_index);
  }
  return result;
}

bool thread_pinning_supported() {
  return os_thread_pinning_supported();
}

bool numa_binding_supported() {
  return os_numa_binding_supported();
}

bool can_detect_huge_pages_configuration() {
  return os_can_detect_huge_pages_configuration();
}

bool huge_pages_configured() {
  return os_huge_pages_configured();
}

bool numa_detected() {
  return os_numa_detected();
}

std::string platform_tuning_summary() {
  std::string out = os_platform_name();
  if (os_can_detect_huge_pages_configuration()) {
    out += std::string(" huge_pages=") + (os_huge_pages_configured() ? "on" : "off");
  }
  out += std::string(" numa=") + (os_numa_detected() ? "yes" : "no");
  out += " affinity=" + affinity_plan().source;
  return out;
}

} // namespace rxminer
