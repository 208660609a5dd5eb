#include "rxminer/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rxminer {

namespace {

constexpr size_t kMaxRuntimeLogLines = 5000;

std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;
std::deque<std::string> g_runtime_logs;

std::string clock_prefix() {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream oss;
  oss << '[' << std::put_time(&tm, "%H:%M:%S") << ']';
  return oss.str();
}

std::string upper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

} // namespace

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
}

bool parse_log_level(std::string_view text, LogLevel* out) {
  const std::string value = upper(text);
  LogLevel level = LogLevel::Info;
  if (value == "DEBUG" || value == "TRACE") {
    level = LogLevel::Debug;
  } else if (value == "INFO") {
    level = LogLevel::Info;
  } else if (value == "WARN" || value == "WARNING") {
    level = LogLevel::Warn;
  } else if (value == "ERROR") {
    level = LogLevel::Error;
  } else {
    return false;
  }
  if (out != nullptr) {
    *out = level;
  }
  return true;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

bool apply_log_level_from_env() {
  const char* env = std::getenv("RXMINER_LOG");
  if (env == nullptr || *env == '\0') {
    return false;
  }
  LogLevel level = LogLevel::Info;
  if (!parse_log_level(env, &level)) {
    std::cerr << "ignoring invalid RXMINER_LOG value '" << env << "'\n";
    return false;
  }
  set_log_level(level);
  return true;
}

void log_message(LogLevel level, std::string_view component, std::string_view message) {
  if (!log_enabled(level)) {
    return;
  }

  std::string line = clock_prefix();
  line.push_back(' ');
  line.append(log_level_name(level));
  line.append(level == LogLevel::Info || level == LogLevel::Warn ? "  [" : " [");
  line.append(upper(component));
  line.append("] ");
  line.append(message);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << line << '\n';
  if (g_runtime_logs.size() >= kMaxRuntimeLogLines) {
    g_runtime_logs.pop_front();
  }
  g_runtime_logs.push_back(std::move(line));
}

std::vector<std::string> recent_log_lines(size_t max_lines) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_lines, g_runtime_logs.size());
  return std::vector<std::string>(g_runtime_logs.end() - static_cast<std::ptrdiff_t>(count), g_runtime_logs.end());
}

std::string format_hashrate(double hps) {
  static constexpr const char* suffixes[] = {"H/s", "kH/s", "MH/s", "GH/s", "TH/s"};
  size_t suffix_idx = 0;
  while (hps >= 1000.0 && suffix_idx + 1 < (sizeof(suffixes) / sizeof(suffixes[0]))) {
    hps /= 1000.0;
    ++suffix_idx;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << hps << ' ' << suffixes[suffix_idx];
  return oss.str();
}

} // namespace rxminer
