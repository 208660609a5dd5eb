#include "rxminer/perf_platform.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <pthread.h>
#include <sched.h>

#ifdef RXMINER_HAVE_LIBNUMA
#include <numa.h>
#endif

namespace rxminer {

namespace {

constexpr uint64_t kRandomXHugePagesNeeded = 1168;

bool parse_cpu_dir_index(const std::string& name, uint32_t* out) {
  if (name.size() < 4 || name.rfind("cpu", 0) != 0) {
    return false;
  }
  uint64_t value = 0;
  for (size_t i = 3; i < name.size(); ++i) {
    if (name[i] < '0' || name[i] > '9') {
      return false;
    }
    value = value * 10U + static_cast<uint64_t>(name[i] - '0');
  }
  *out = static_cast<uint32_t>(value);
  return true;
}

template <typename T>
bool read_sysfs_value(const std::filesystem::path& path, T* out) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  in >> *out;
  return !in.fail();
}

} // namespace

bool os_build_affinity_plan(AffinityPlanData* plan) {
  struct CpuInfo {
    uint32_t cpu = 0;
    uint32_t package = 0;
    uint32_t core = 0;
    int core_type = 0;
    uint64_t max_freq_khz = 0;
  };

  std::vector<CpuInfo> cpus;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/sys/devices/system/cpu", ec)) {
    uint32_t index = 0;
    if (!entry.is_directory(ec) || !parse_cpu_dir_index(entry.path().filename().string(), &index)) {
      continue;
    }
    int core_id = static_cast<int>(index);
    int package_id = 0;
    CpuInfo info;
    info.cpu = index;
    read_sysfs_value(entry.path() / "topology" / "core_id", &core_id);
    read_sysfs_value(entry.path() / "topology" / "physical_package_id", &package_id);
    read_sysfs_value(entry.path() / "topology" / "core_type", &info.core_type);
    read_sysfs_value(entry.path() / "cpufreq" / "cpuinfo_max_freq", &info.max_freq_khz);
    info.core = static_cast<uint32_t>(std::max(0, core_id));
    info.package = static_cast<uint32_t>(std::max(0, package_id));
    cpus.push_back(info);
  }
  if (cpus.empty()) {
    return false;
  }

  std::sort(cpus.begin(), cpus.end(), [](const CpuInfo& a, const CpuInfo& b) { return a.cpu < b.cpu; });

  const bool has_core_type = std::any_of(cpus.begin(), cpus.end(), [](const CpuInfo& c) { return c.core_type > 0; });
  uint64_t max_freq = 0;
  for (const auto& c : cpus) {
    max_freq = std::max(max_freq, c.max_freq_khz);
  }
  // Cores more than 200 MHz below the fastest one count as efficiency cores.
  const uint64_t fast_threshold = max_freq > 200000 ? max_freq - 200000 : max_freq;

  std::map<std::pair<uint32_t, uint32_t>, uint32_t> siblings;
  for (const auto& c : cpus) {
    AffinitySlot slot;
    slot.os_cpu = c.cpu;
    slot.package_id = c.package;
    slot.core_id = c.core;
    if (has_core_type) {
      slot.performance_tier = c.core_type == 1 ? 1U : 0U;
    } else if (max_freq > 0) {
      slot.performance_tier = c.max_freq_khz >= fast_threshold ? 0U : 1U;
    }
    slot.sibling_index = siblings[{c.package, c.core}]++;
    plan->slots.push_back(slot);
  }

  plan->source = "linux-sysfs";
  plan->logical_cpus = static_cast<uint32_t>(plan->slots.size());
  plan->physical_cores = static_cast<uint32_t>(siblings.size());
  return true;
}

bool os_pin_current_thread(const AffinitySlot& slot) {
  if (slot.os_cpu >= CPU_SETSIZE) {
    return false;
  }
  cpu_set_t set;
  CPU_ZERO(&set);
  CPU_SET(slot.os_cpu, &set);
  return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &set) == 0;
}

bool os_bind_current_thread_numa(uint32_t worker_index) {
#ifdef RXMINER_HAVE_LIBNUMA
  if (numa_available() < 0) {
    return false;
  }
  const int max_node = numa_max_node();
  if (max_node < 1) {
    return false;
  }
  const int node = static_cast<int>(worker_index % static_cast<uint32_t>(max_node + 1));
  return numa_run_on_node(node) == 0;
#else
  (void)worker_index;
  return false;
#endif
}

bool os_lower_mining_thread_priority() {
  sched_param param{};
  param.sched_priority = 0;
  return pthread_setschedparam(pthread_self(), SCHED_BATCH, &param) == 0;
}

bool os_thread_pinning_supported() {
  return true;
}

bool os_numa_binding_supported() {
#ifdef RXMINER_HAVE_LIBNUMA
  return numa_available() == 0;
#else
  return false;
#endif
}

bool os_can_detect_huge_pages_configuration() {
  return true;
}

bool os_huge_pages_configured() {
  uint64_t pages = 0;
  if (!read_sysfs_value(std::filesystem::path("/proc/sys/vm/nr_hugepages"), &pages)) {
    return false;
  }
  return pages >= kRandomXHugePagesNeeded;
}

bool os_numa_detected() {
#ifdef RXMINER_HAVE_LIBNUMA
  if (numa_available() == 0 && numa_max_node() > 0) {
    return true;
  }
#endif
  std::string online;
  if (!read_sysfs_value(std::filesystem::path("/sys/devices/system/node/online"), &online)) {
    return false;
  }
  return online.find_first_of("-,") != std::string::npos;
}

const char* os_platform_name() {
  return "linux";
}

} // namespace rxminer
