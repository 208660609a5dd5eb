#include "rxminer/config.hpp"

#include "rxminer/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace rxminer {
namespace {

constexpr const char* kWallet = "44AFFq5kSiGBoZ4NMDwYtN18obc8AemS33DBLWs3H7otXft3XjrpDtQGv7SqSsaBYBb98uNbr2VBBEt7f2wfn3RVGQBEP3A";

std::string pool_config(const std::string& user) {
  return std::string(R"({
    "general": {"algorithm": "rx/0", "worker_threads": 3, "batch_size": 500, "log_level": "debug"},
    "randomx": {"full_mem": false, "init_threads": 2},
    "tuning": {"pin_threads": false},
    "mode": {"pool": {"url": "stratum+tcp://pool.example.com:3333", "user": ")") + user + R"(", "worker_id": "rig7"}}
  })";
}

TEST(ConfigTest, ParsesAllSections) {
  const Config config = parse_config(pool_config(kWallet));

  EXPECT_EQ(config.general.algorithm, "rx/0");
  EXPECT_EQ(config.general.worker_threads, 3U);
  EXPECT_EQ(config.general.batch_size, 500U);
  EXPECT_EQ(config.general.stats_interval_secs, 60U);
  EXPECT_EQ(config.general.log_level, "debug");
  EXPECT_FALSE(config.randomx.full_mem);
  EXPECT_TRUE(config.randomx.jit);
  EXPECT_EQ(config.randomx.init_threads, 2U);
  EXPECT_FALSE(config.tuning.pin_threads);
  ASSERT_TRUE(config.pool.has_value());
  EXPECT_EQ(config.pool->worker_id, "rig7");
  EXPECT_EQ(config.pool->password, "x");
  EXPECT_EQ(config.pool->keepalive_secs, 30U);
  EXPECT_FALSE(config.node.has_value());

  EXPECT_NO_THROW(validate_config(config));
  EXPECT_EQ(configured_algorithm(config), AlgorithmKind::RandomX);
}

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
  const Config config = parse_config("{}");
  EXPECT_EQ(config.general.algorithm, "randomx");
  EXPECT_EQ(config.general.batch_size, 1000U);
  EXPECT_TRUE(config.tuning.pin_threads);
  EXPECT_FALSE(config.pool.has_value());
  EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ConfigTest, MalformedOrMistypedInputIsAConfigError) {
  EXPECT_THROW(parse_config("{\"general\": "), ConfigError);
  EXPECT_THROW(parse_config("[]"), ConfigError);
  EXPECT_THROW(parse_config(R"({"general": {"batch_size": "many"}})"), ConfigError);
  EXPECT_THROW(parse_config(R"({"general": {"worker_threads": -1}})"), ConfigError);
  EXPECT_THROW(parse_config(R"({"general": {"worker_threads": 5000000000}})"), ConfigError);
  EXPECT_THROW(parse_config(R"({"tuning": true})"), ConfigError);
  EXPECT_THROW(parse_config(R"({"randomx": {"jit": "yes"}})"), ConfigError);
}

TEST(ConfigTest, ValidationRejectsBadValues) {
  Config config = parse_config(pool_config(kWallet));

  Config bad = config;
  bad.general.algorithm = "sha256d";
  EXPECT_THROW(validate_config(bad), ConfigError);

  bad = config;
  bad.general.batch_size = 0;
  EXPECT_THROW(validate_config(bad), ConfigError);

  bad = config;
  bad.general.hashrate_window_secs = 0;
  EXPECT_THROW(validate_config(bad), ConfigError);

  bad = config;
  bad.general.log_level = "chatty";
  EXPECT_THROW(validate_config(bad), ConfigError);

  bad = config;
  bad.pool->url.clear();
  EXPECT_THROW(validate_config(bad), ConfigError);
}

TEST(ConfigTest, PlaceholderWalletsAreRejected) {
  EXPECT_THROW(validate_config(parse_config(pool_config("your_wallet_address"))), ConfigError);
  EXPECT_THROW(validate_config(parse_config(pool_config("<wallet>"))), ConfigError);
  EXPECT_THROW(validate_config(parse_config(pool_config(""))), ConfigError);
}

TEST(ConfigTest, NodeModeValidation) {
  Config config = parse_config(R"({
    "mode": {"node": {"rpc_url": "http://127.0.0.1:18081/json_rpc", "wallet_address": "4Abc", "poll_interval_ms": 250}}
  })");
  ASSERT_TRUE(config.node.has_value());
  EXPECT_EQ(config.node->poll_interval_ms, 250U);
  EXPECT_NO_THROW(validate_config(config));

  config.node->poll_interval_ms = 0;
  EXPECT_THROW(validate_config(config), ConfigError);
  config.node->poll_interval_ms = 250;
  config.node->wallet_address = "your_wallet_address";
  EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ConfigTest, PoolWinsWhenBothModesAreSet) {
  Config config = parse_config(pool_config(kWallet));
  NodeConfig node;
  node.rpc_url = "http://127.0.0.1:18081";
  config.node = node;
  EXPECT_NO_THROW(validate_config(config));
}

TEST(ConfigTest, TemplateParsesButNeedsAWallet) {
  const Config pool = parse_config(generate_config_template(false, false));
  ASSERT_TRUE(pool.pool.has_value());
  EXPECT_FALSE(pool.node.has_value());
  EXPECT_EQ(pool.general.algorithm, "randomx");
  EXPECT_THROW(validate_config(pool), ConfigError);

  const Config node = parse_config(generate_config_template(false, true));
  EXPECT_FALSE(node.pool.has_value());
  ASSERT_TRUE(node.node.has_value());
  EXPECT_EQ(node.node->rpc_url, "http://127.0.0.1:18081/json_rpc");
  EXPECT_THROW(validate_config(node), ConfigError);

  const Config both = parse_config(generate_config_template(true, true));
  EXPECT_TRUE(both.pool.has_value());
  EXPECT_TRUE(both.node.has_value());
}

TEST(ConfigTest, LoadsFromFile) {
  const auto path = std::filesystem::temp_directory_path() /
    ("rxminer_config_test_" + std::to_string(::getpid()) + ".json");
  write_config_template(path, true, false);
  const Config config = load_config(path);
  EXPECT_TRUE(config.pool.has_value());
  std::filesystem::remove(path);

  EXPECT_THROW(load_config(path), ConfigError);
}

TEST(ConfigTest, SanitizeResolvesAutomaticThreads) {
  Config config = parse_config(pool_config(kWallet));
  config.general.worker_threads = 0;
  std::vector<std::string> notes;
  sanitize_runtime_config(&config, &notes);
  EXPECT_GT(config.general.worker_threads, 0U);
  ASSERT_FALSE(notes.empty());
  EXPECT_EQ(notes.front().rfind("cpu profile: ", 0), 0U);
}

} // namespace
} // namespace rxminer
