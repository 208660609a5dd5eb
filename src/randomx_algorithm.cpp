#include "rxminer/randomx_algorithm.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#ifdef RXMINER_HAVE_RANDOMX
#include <randomx.h>
#endif

namespace rxminer {

namespace {

#ifdef RXMINER_HAVE_RANDOMX

struct RandomXResources {
  randomx_flags flags = RANDOMX_FLAG_DEFAULT;
  randomx_cache* cache = nullptr;
  randomx_dataset* dataset = nullptr;

  RandomXResources() = default;
  RandomXResources(const RandomXResources&) = delete;
  RandomXResources& operator=(const RandomXResources&) = delete;
  RandomXResources(RandomXResources&& other) noexcept { *this = std::move(other); }
  RandomXResources& operator=(RandomXResources&& other) noexcept {
    if (this != &other) {
      release();
      flags = other.flags;
      cache = std::exchange(other.cache, nullptr);
      dataset = std::exchange(other.dataset, nullptr);
    }
    return *this;
  }
  ~RandomXResources() { release(); }

  void release() {
    if (dataset != nullptr) {
      randomx_release_dataset(dataset);
      dataset = nullptr;
    }
    if (cache != nullptr) {
      randomx_release_cache(cache);
      cache = nullptr;
    }
  }
};

bool try_allocate(
  randomx_flags flags,
  bool full_mem,
  const std::vector<uint8_t>& seed,
  uint32_t init_threads,
  RandomXResources* out,
  std::string* error_reason) {
  RandomXResources res;
  res.flags = flags;
  res.cache = randomx_alloc_cache(flags);
  if (res.cache == nullptr) {
    *error_reason = "randomx_alloc_cache failed";
    return false;
  }
  randomx_init_cache(res.cache, seed.data(), seed.size());

  if (full_mem) {
    res.dataset = randomx_alloc_dataset(flags);
    if (res.dataset == nullptr) {
      *error_reason = "randomx_alloc_dataset failed";
      return false;
    }

    const auto item_count = randomx_dataset_item_count();
    const uint32_t threads = std::max<uint32_t>(1U, init_threads);
    const uint64_t chunk = (item_count + threads - 1U) / threads;

    std::vector<std::thread> initializers;
    initializers.reserve(threads);
    for (uint32_t i = 0; i < threads; ++i) {
      const uint64_t start = chunk * i;
      if (start >= item_count) {
        break;
      }
      const uint64_t count = std::min<uint64_t>(chunk, item_count - start);
      initializers.emplace_back([dataset = res.dataset, cache = res.cache, start, count]() {
        randomx_init_dataset(dataset, cache, start, count);
      });
    }
    for (auto& t : initializers) {
      t.join();
    }
  }

  *out = std::move(res);
  return true;
}

class RandomXContext;

class RandomXEngine final : public HashEngine {
public:
  RandomXEngine(std::shared_ptr<const RandomXContext> context, randomx_vm* vm)
    : context_(std::move(context)), vm_(vm) {}
  ~RandomXEngine() override { randomx_destroy_vm(vm_); }

  Digest hash(const BlobTemplate& blob, uint64_t nonce) override {
    encode_hash_input(blob, nonce, &input_);
    Digest out;
    randomx_calculate_hash(vm_, input_.data(), input_.size(), out.bytes.data());
    return out;
  }

private:
  std::shared_ptr<const RandomXContext> context_;
  randomx_vm* vm_;
  std::vector<uint8_t> input_;
};

class RandomXContext final : public AlgorithmContext {
public:
  RandomXContext(std::vector<uint8_t> seed, MemoryMode mode, RandomXResources resources)
    : AlgorithmContext(AlgorithmKind::RandomX, std::move(seed), mode),
      resources_(std::move(resources)) {}

  std::unique_ptr<HashEngine> new_engine() const override {
    auto* vm = randomx_create_vm(resources_.flags, resources_.cache, resources_.dataset);
    if (vm == nullptr) {
      throw ContextInitError("randomx_create_vm failed");
    }
    return std::make_unique<RandomXEngine>(
      std::static_pointer_cast<const RandomXContext>(shared_from_this()), vm);
  }

  HashingRuntimeProfile runtime_profile() const override {
    HashingRuntimeProfile profile;
    profile.full_mem = resources_.dataset != nullptr;
    profile.huge_pages = (resources_.flags & RANDOMX_FLAG_LARGE_PAGES) != 0;
    profile.jit = (resources_.flags & RANDOMX_FLAG_JIT) != 0;
    profile.hard_aes = (resources_.flags & RANDOMX_FLAG_HARD_AES) != 0;
    profile.secure = (resources_.flags & RANDOMX_FLAG_SECURE) != 0;
    profile.memory_bytes = profile.full_mem ? kRandomXFastModeBytes : kRandomXLightModeBytes;
    return profile;
  }

private:
  RandomXResources resources_;
};

#endif

} // namespace

RandomXAlgorithm::RandomXAlgorithm(HashingConfig config) : config_(config) {}

bool randomx_backend_available() {
#ifdef RXMINER_HAVE_RANDOMX
  return true;
#else
  return false;
#endif
}

#ifdef RXMINER_HAVE_RANDOMX

std::shared_ptr<const AlgorithmContext> RandomXAlgorithm::build_context(
  const std::vector<uint8_t>& seed,
  MemoryMode mode) const {
  if (seed.empty()) {
    throw ContextInitError("RandomX seed is empty");
  }

  const randomx_flags supported = randomx_get_flags();
  randomx_flags base_flags = static_cast<randomx_flags>(RANDOMX_FLAG_DEFAULT | (supported & RANDOMX_FLAG_ARGON2));

  if (config_.jit) {
    if ((supported & RANDOMX_FLAG_JIT) != 0) {
      base_flags = static_cast<randomx_flags>(base_flags | RANDOMX_FLAG_JIT);
    } else {
      log_warn("randomx", "JIT requested but unavailable on this build, continuing without JIT");
    }
  }
  if (config_.hard_aes) {
    if ((supported & RANDOMX_FLAG_HARD_AES) != 0) {
      base_flags = static_cast<randomx_flags>(base_flags | RANDOMX_FLAG_HARD_AES);
    } else {
      log_warn("randomx", "HARD_AES requested but unavailable on this CPU, continuing with soft AES");
    }
  }
  if (config_.secure) {
    base_flags = static_cast<randomx_flags>(base_flags | RANDOMX_FLAG_SECURE);
  }

  bool want_full_mem = mode == MemoryMode::Fast && config_.full_mem;
  bool want_large_pages = config_.huge_pages;
  const uint32_t init_threads = config_.init_threads != 0
    ? config_.init_threads
    : std::max(1U, std::thread::hardware_concurrency());

  auto make_flags = [&]() {
    randomx_flags flags = base_flags;
    if (want_full_mem) {
      flags = static_cast<randomx_flags>(flags | RANDOMX_FLAG_FULL_MEM);
    }
    if (want_large_pages) {
      flags = static_cast<randomx_flags>(flags | RANDOMX_FLAG_LARGE_PAGES);
    }
    return flags;
  };

  const auto started = std::chrono::steady_clock::now();
  std::string reason;
  RandomXResources resources;
  auto attempt = [&]() {
    return try_allocate(make_flags(), want_full_mem, seed, init_threads, &resources, &reason);
  };

  bool ok = attempt();
  // A large page failure drops only LARGE_PAGES; HARD_AES and JIT are kept.
  if (!ok && want_large_pages) {
    log_warn("randomx", "large pages unavailable (" + reason + "), retrying without large pages");
    want_large_pages = false;
    ok = attempt();
  }
  if (!ok && (base_flags & RANDOMX_FLAG_HARD_AES) != 0) {
    log_warn("randomx", "HARD_AES init failed (" + reason + "), retrying with soft AES");
    base_flags = static_cast<randomx_flags>(base_flags & ~RANDOMX_FLAG_HARD_AES);
    ok = attempt();
  }
  if (!ok && (base_flags & RANDOMX_FLAG_JIT) != 0) {
    log_warn("randomx", "JIT init failed (" + reason + "), retrying without JIT");
    base_flags = static_cast<randomx_flags>(base_flags & ~(RANDOMX_FLAG_JIT | RANDOMX_FLAG_SECURE));
    ok = attempt();
  }
  if (!ok && want_full_mem) {
    log_warn("randomx", "full-memory mode unavailable (" + reason + "), retrying in light mode");
    want_full_mem = false;
    ok = attempt();
    if (ok) {
      log_warn("randomx", "light mode enabled, hashrate will be lower");
    }
  }
  if (!ok) {
    throw ContextInitError("RandomX initialization failed: " + reason);
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started).count();
  log_info(
    "randomx",
    std::string(want_full_mem ? "dataset" : "cache") + " ready in " + std::to_string(elapsed_ms) +
      " ms (seed " + to_hex(seed).substr(0, 16) + ")");

  return std::make_shared<RandomXContext>(
    seed,
    want_full_mem ? MemoryMode::Fast : MemoryMode::Light,
    std::move(resources));
}

#else

std::shared_ptr<const AlgorithmContext> RandomXAlgorithm::build_context(
  const std::vector<uint8_t>&,
  MemoryMode) const {
  throw ContextInitError("RandomX support is not available in this build (librandomx not found)");
}

#endif

} // namespace rxminer
