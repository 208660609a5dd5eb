#pragma once

#include "rxminer/algorithm.hpp"
#include "rxminer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rxminer {

struct GeneralConfig {
  std::string algorithm = "randomx";
  // 0 selects the recommended count for this machine.
  uint32_t worker_threads = 0;
  uint32_t batch_size = 1000;
  uint64_t stats_interval_secs = 60;
  uint64_t hashrate_window_secs = 60;
  std::string log_level = "info";
};

struct TuningConfig {
  bool pin_threads = true;
  bool numa_bind = false;
};

struct PoolConfig {
  std::string url;
  std::string user;
  std::string password = "x";
  std::string worker_id;
  uint64_t keepalive_secs = 30;
};

struct NodeConfig {
  std::string rpc_url;
  std::string rpc_user;
  std::string rpc_password;
  std::string wallet_address;
  uint64_t poll_interval_ms = 1000;
};

struct Config {
  GeneralConfig general;
  HashingConfig randomx;
  TuningConfig tuning;
  std::optional<PoolConfig> pool;
  std::optional<NodeConfig> node;
};

// Throws ConfigError when the file cannot be read, is not valid JSON or a
// field has the wrong type. Missing fields keep their defaults.
Config load_config(const std::filesystem::path& path);
Config parse_config(const std::string& text);

// Throws ConfigError on the first violation.
void validate_config(const Config& config);

AlgorithmKind configured_algorithm(const Config& config);

// Resolves automatic values and disables tuning options the platform cannot
// honour. Each adjustment is appended to notes.
void sanitize_runtime_config(Config* config, std::vector<std::string>* notes);

// Template written by the config command and by start when no file exists.
// Emits the pool section when neither flag is set.
std::string generate_config_template(bool pool, bool node);
void write_config_template(const std::filesystem::path& path, bool pool, bool node);

} // namespace rxminer
