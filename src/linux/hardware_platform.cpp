#include "rxminer/hardware_platform.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace rxminer {

namespace {

bool read_first_line(const std::filesystem::path& path, std::string* out) {
  std::ifstream in(path);
  return in && std::getline(in, *out);
}

std::optional<double> read_millidegrees(const std::filesystem::path& path) {
  std::string line;
  if (!read_first_line(path, &line)) {
    return std::nullopt;
  }
  int64_t millidegrees = 0;
  const auto res = std::from_chars(line.data(), line.data() + line.size(), millidegrees);
  if (res.ec != std::errc()) {
    return std::nullopt;
  }
  const double value = static_cast<double>(millidegrees) / 1000.0;
  if (value <= 0.0 || value >= 150.0) {
    return std::nullopt;
  }
  return value;
}

bool is_cpu_sensor(const std::string& name) {
  return name == "coretemp" || name == "k10temp" || name == "zenpower" || name == "cpu_thermal";
}

} // namespace

bool os_read_cpu_times(CpuTimes* out) {
  std::ifstream in("/proc/stat");
  std::string label;
  if (!(in >> label) || label != "cpu") {
    return false;
  }
  // user nice system idle iowait irq softirq steal
  uint64_t fields[8] = {};
  for (auto& field : fields) {
    if (!(in >> field)) {
      return false;
    }
  }
  const uint64_t idle = fields[3] + fields[4];
  uint64_t total = 0;
  for (const auto field : fields) {
    total += field;
  }
  out->total = total;
  out->busy = total - idle;
  return true;
}

std::optional<uint64_t> os_memory_used_bytes() {
  std::ifstream in("/proc/meminfo");
  std::string line;
  uint64_t total_kib = 0;
  uint64_t available_kib = 0;
  bool have_total = false;
  bool have_available = false;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string key;
    uint64_t value = 0;
    if (!(fields >> key >> value)) {
      continue;
    }
    if (key == "MemTotal:") {
      total_kib = value;
      have_total = true;
    } else if (key == "MemAvailable:") {
      available_kib = value;
      have_available = true;
    }
  }
  if (!have_total || !have_available || available_kib > total_kib) {
    return std::nullopt;
  }
  return (total_kib - available_kib) * 1024ULL;
}

std::optional<double> os_cpu_temperature_c() {
  std::error_code ec;
  for (const auto& hwmon : std::filesystem::directory_iterator("/sys/class/hwmon", ec)) {
    std::string name;
    if (!read_first_line(hwmon.path() / "name", &name) || !is_cpu_sensor(name)) {
      continue;
    }
    // temp1 is the package (coretemp) or Tctl (k10temp) reading.
    if (const auto value = read_millidegrees(hwmon.path() / "temp1_input")) {
      return value;
    }
  }

  std::optional<double> fallback;
  for (const auto& zone : std::filesystem::directory_iterator("/sys/class/thermal", ec)) {
    if (zone.path().filename().string().rfind("thermal_zone", 0) != 0) {
      continue;
    }
    std::string type;
    read_first_line(zone.path() / "type", &type);
    const auto value = read_millidegrees(zone.path() / "temp");
    if (!value) {
      continue;
    }
    if (type == "x86_pkg_temp" || type.find("cpu") != std::string::npos) {
      return value;
    }
    if (!fallback) {
      fallback = value;
    }
  }
  return fallback;
}

} // namespace rxminer
