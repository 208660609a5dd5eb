#include "rxminer/config.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/json.hpp"
#include "rxminer/log.hpp"
#include "rxminer/perf.hpp"

#include <fstream>
#include <iterator>
#include <limits>

namespace rxminer {

namespace {

constexpr const char* kPlaceholderWallet = "your_wallet_address";

bool is_placeholder_wallet(const std::string& value) {
  return value.empty() || value == kPlaceholderWallet || value.front() == '<';
}

const JsonValue* section(const JsonValue& root, std::string_view key) {
  const JsonValue* value = root.find(key);
  if (value == nullptr || value->is_null()) {
    return nullptr;
  }
  if (!value->is_object()) {
    throw ConfigError("config section '" + std::string(key) + "' must be an object");
  }
  return value;
}

uint32_t narrow_u32(uint64_t value, std::string_view key) {
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw ConfigError("config value '" + std::string(key) + "' is out of range");
  }
  return static_cast<uint32_t>(value);
}

void read_general(const JsonValue& obj, GeneralConfig* general) {
  if (auto v = json_string_member(obj, "algorithm")) general->algorithm = *v;
  if (auto v = json_uint_member(obj, "worker_threads")) general->worker_threads = narrow_u32(*v, "worker_threads");
  if (auto v = json_uint_member(obj, "batch_size")) general->batch_size = narrow_u32(*v, "batch_size");
  if (auto v = json_uint_member(obj, "stats_interval_secs")) general->stats_interval_secs = *v;
  if (auto v = json_uint_member(obj, "hashrate_window_secs")) general->hashrate_window_secs = *v;
  if (auto v = json_string_member(obj, "log_level")) general->log_level = *v;
}

void read_randomx(const JsonValue& obj, HashingConfig* randomx) {
  if (auto v = json_bool_member(obj, "full_mem")) randomx->full_mem = *v;
  if (auto v = json_bool_member(obj, "huge_pages")) randomx->huge_pages = *v;
  if (auto v = json_bool_member(obj, "jit")) randomx->jit = *v;
  if (auto v = json_bool_member(obj, "hard_aes")) randomx->hard_aes = *v;
  if (auto v = json_bool_member(obj, "secure")) randomx->secure = *v;
  if (auto v = json_uint_member(obj, "init_threads")) randomx->init_threads = narrow_u32(*v, "init_threads");
}

void read_tuning(const JsonValue& obj, TuningConfig* tuning) {
  if (auto v = json_bool_member(obj, "pin_threads")) tuning->pin_threads = *v;
  if (auto v = json_bool_member(obj, "numa_bind")) tuning->numa_bind = *v;
}

PoolConfig read_pool(const JsonValue& obj) {
  PoolConfig pool;
  if (auto v = json_string_member(obj, "url")) pool.url = *v;
  if (auto v = json_string_member(obj, "user")) pool.user = *v;
  if (auto v = json_string_member(obj, "password")) pool.password = *v;
  if (auto v = json_string_member(obj, "worker_id")) pool.worker_id = *v;
  if (auto v = json_uint_member(obj, "keepalive_secs")) pool.keepalive_secs = *v;
  return pool;
}

NodeConfig read_node(const JsonValue& obj) {
  NodeConfig node;
  if (auto v = json_string_member(obj, "rpc_url")) node.rpc_url = *v;
  if (auto v = json_string_member(obj, "rpc_user")) node.rpc_user = *v;
  if (auto v = json_string_member(obj, "rpc_password")) node.rpc_password = *v;
  if (auto v = json_string_member(obj, "wallet_address")) node.wallet_address = *v;
  if (auto v = json_uint_member(obj, "poll_interval_ms")) node.poll_interval_ms = *v;
  return node;
}

Config config_from_json(const JsonValue& root) {
  if (!root.is_object()) {
    throw ConfigError("config root must be an object");
  }

  Config config;
  if (const JsonValue* general = section(root, "general")) read_general(*general, &config.general);
  if (const JsonValue* randomx = section(root, "randomx")) read_randomx(*randomx, &config.randomx);
  if (const JsonValue* tuning = section(root, "tuning")) read_tuning(*tuning, &config.tuning);
  if (const JsonValue* mode = section(root, "mode")) {
    if (const JsonValue* pool = section(*mode, "pool")) config.pool = read_pool(*pool);
    if (const JsonValue* node = section(*mode, "node")) config.node = read_node(*node);
  }
  return config;
}

JsonValue pool_template() {
  return JsonValue(JsonValue::object{
    {"url", JsonValue("stratum+tcp://pool.example.com:3333")},
    {"user", JsonValue(kPlaceholderWallet)},
    {"password", JsonValue("x")},
    {"worker_id", JsonValue("worker01")},
    {"keepalive_secs", JsonValue(static_cast<uint64_t>(30))},
  });
}

JsonValue node_template() {
  return JsonValue(JsonValue::object{
    {"rpc_url", JsonValue("http://127.0.0.1:18081/json_rpc")},
    {"rpc_user", JsonValue("")},
    {"rpc_password", JsonValue("")},
    {"wallet_address", JsonValue(kPlaceholderWallet)},
    {"poll_interval_ms", JsonValue(static_cast<uint64_t>(1000))},
  });
}

} // namespace

Config parse_config(const std::string& text) {
  try {
    return config_from_json(parse_json(text));
  } catch (const JsonError& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
}

Config load_config(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("failed to read config file: " + path.string());
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return parse_config(text);
}

AlgorithmKind configured_algorithm(const Config& config) {
  const auto kind = parse_algorithm_kind(config.general.algorithm);
  if (!kind) {
    throw ConfigError("unknown algorithm '" + config.general.algorithm + "'");
  }
  return *kind;
}

void validate_config(const Config& config) {
  (void)configured_algorithm(config);

  if (config.general.batch_size == 0) {
    throw ConfigError("config general.batch_size must be > 0");
  }
  if (config.general.stats_interval_secs == 0) {
    throw ConfigError("config general.stats_interval_secs must be > 0");
  }
  if (config.general.hashrate_window_secs == 0) {
    throw ConfigError("config general.hashrate_window_secs must be > 0");
  }
  LogLevel level;
  if (!parse_log_level(config.general.log_level, &level)) {
    throw ConfigError("config general.log_level must be debug, info, warn or error");
  }

  if (!config.pool && !config.node) {
    throw ConfigError("config needs a mining mode: add mode.pool or mode.node");
  }
  if (config.pool) {
    if (config.node) {
      log_info("config", "both mode.pool and mode.node are set; mining to the pool");
    }
    if (config.pool->url.empty()) {
      throw ConfigError("config mode.pool.url is missing");
    }
    if (is_placeholder_wallet(config.pool->user)) {
      throw ConfigError("config mode.pool.user is missing; set it to your wallet address");
    }
    return;
  }

  if (config.node->rpc_url.empty()) {
    throw ConfigError("config mode.node.rpc_url is missing");
  }
  if (is_placeholder_wallet(config.node->wallet_address)) {
    throw ConfigError("config mode.node.wallet_address is missing");
  }
  if (config.node->poll_interval_ms == 0) {
    throw ConfigError("config mode.node.poll_interval_ms must be > 0");
  }
}

void sanitize_runtime_config(Config* config, std::vector<std::string>* notes) {
  notes->push_back("cpu profile: " + cpu_runtime_summary());

  auto& general = config->general;
  if (general.worker_threads == 0) {
    general.worker_threads = recommended_mining_threads();
    notes->push_back(
      "worker_threads was 0; using recommended mining threads (" + std::to_string(general.worker_threads) +
      ", physical=" + std::to_string(physical_cpu_count()) +
      ", logical=" + std::to_string(logical_cpu_count()) + ")");
  }

  auto& tuning = config->tuning;
  if (tuning.pin_threads && !thread_pinning_supported()) {
    tuning.pin_threads = false;
    notes->push_back("pin_threads disabled: CPU affinity is not supported on this platform");
  } else if (tuning.pin_threads) {
    notes->push_back("affinity profile: " + affinity_profile_summary(general.worker_threads, 10));
  }

  if (tuning.numa_bind && !numa_binding_supported()) {
    tuning.numa_bind = false;
    notes->push_back("numa_bind disabled: NUMA binding is unavailable on this platform/build");
  } else if (tuning.numa_bind && !numa_detected()) {
    tuning.numa_bind = false;
    notes->push_back("numa_bind disabled: no multi-node NUMA topology detected");
  }

  if (config->randomx.huge_pages && can_detect_huge_pages_configuration() && !huge_pages_configured()) {
    notes->push_back("huge_pages requested: host precheck reports not configured; runtime will fall back");
  }
  if (!config->randomx.hard_aes && !config->randomx.jit) {
    notes->push_back("RandomX jit and hard_aes are both off; expect a very low hashrate");
  }
}

std::string generate_config_template(bool pool, bool node) {
  if (!pool && !node) {
    pool = true;
  }

  JsonValue::object mode;
  if (pool) mode.emplace("pool", pool_template());
  if (node) mode.emplace("node", node_template());

  JsonValue::object root{
    {"general", JsonValue(JsonValue::object{
      {"algorithm", JsonValue("randomx")},
      {"worker_threads", JsonValue(static_cast<uint64_t>(0))},
      {"batch_size", JsonValue(static_cast<uint64_t>(1000))},
      {"stats_interval_secs", JsonValue(static_cast<uint64_t>(60))},
      {"hashrate_window_secs", JsonValue(static_cast<uint64_t>(60))},
      {"log_level", JsonValue("info")},
    })},
    {"randomx", JsonValue(JsonValue::object{
      {"full_mem", JsonValue(true)},
      {"huge_pages", JsonValue(true)},
      {"jit", JsonValue(true)},
      {"hard_aes", JsonValue(true)},
      {"secure", JsonValue(false)},
    })},
    {"tuning", JsonValue(JsonValue::object{
      {"pin_threads", JsonValue(true)},
      {"numa_bind", JsonValue(false)},
    })},
    {"mode", JsonValue(std::move(mode))},
    {"_note", JsonValue("Algorithms: randomx, cryptonight-v7, cryptonight-r. worker_threads 0 = auto. "
                        "Replace your_wallet_address before mining.")},
  };
  return to_json(JsonValue(std::move(root)), true) + "\n";
}

void write_config_template(const std::filesystem::path& path, bool pool, bool node) {
  std::ofstream out(path);
  if (!out) {
    throw ConfigError("failed to create config file: " + path.string());
  }
  out << generate_config_template(pool, node);
  if (!out) {
    throw ConfigError("failed to write config file: " + path.string());
  }
}

} // namespace rxminer
