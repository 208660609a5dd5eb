#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rxminer {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

bool parse_log_level(std::string_view text, LogLevel* out);
const char* log_level_name(LogLevel level);

// Applies RXMINER_LOG from the environment. Returns false if it is unset or invalid.
bool apply_log_level_from_env();

void log_message(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) {
  log_message(LogLevel::Debug, component, message);
}
inline void log_info(std::string_view component, std::string_view message) {
  log_message(LogLevel::Info, component, message);
}
inline void log_warn(std::string_view component, std::string_view message) {
  log_message(LogLevel::Warn, component, message);
}
inline void log_error(std::string_view component, std::string_view message) {
  log_message(LogLevel::Error, component, message);
}

// Last lines written at any enabled level, oldest first.
std::vector<std::string> recent_log_lines(size_t max_lines = 200);

std::string format_hashrate(double hps);

} // namespace rxminer
