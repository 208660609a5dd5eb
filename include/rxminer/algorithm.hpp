#pragma once

#include "rxminer/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rxminer {

struct HashingConfig {
  bool full_mem = true;
  bool huge_pages = true;
  bool jit = true;
  bool hard_aes = true;
  bool secure = false;
  // Threads used to initialize the RandomX dataset; 0 uses every logical CPU.
  uint32_t init_threads = 0;
};

struct HashingRuntimeProfile {
  bool full_mem = false;
  bool huge_pages = false;
  bool jit = false;
  bool hard_aes = false;
  bool secure = false;
  uint64_t memory_bytes = 0;
};

// Per-thread hashing state bound to a single AlgorithmContext. Not thread-safe;
// each worker owns exactly one engine.
class HashEngine {
public:
  virtual ~HashEngine() = default;

  virtual Digest hash(const BlobTemplate& blob, uint64_t nonce) = 0;

  virtual bool verify(const Digest& digest, const Target& target) const {
    return meets_target(digest, target);
  }
};

// Immutable state shared by every worker hashing with the same algorithm and
// seed. Built once per key, released when the last engine drops it.
class AlgorithmContext : public std::enable_shared_from_this<AlgorithmContext> {
public:
  AlgorithmContext(AlgorithmKind kind, std::vector<uint8_t> seed, MemoryMode mode)
    : kind_(kind), seed_(std::move(seed)), mode_(mode) {}
  virtual ~AlgorithmContext() = default;

  AlgorithmContext(const AlgorithmContext&) = delete;
  AlgorithmContext& operator=(const AlgorithmContext&) = delete;

  AlgorithmKind kind() const { return kind_; }
  const std::vector<uint8_t>& seed() const { return seed_; }
  MemoryMode memory_mode() const { return mode_; }

  virtual std::unique_ptr<HashEngine> new_engine() const = 0;
  virtual HashingRuntimeProfile runtime_profile() const { return {}; }

private:
  AlgorithmKind kind_;
  std::vector<uint8_t> seed_;
  MemoryMode mode_;
};

class Algorithm {
public:
  virtual ~Algorithm() = default;

  virtual AlgorithmKind kind() const = 0;
  // Throws ContextInitError when the context cannot be created.
  virtual std::shared_ptr<const AlgorithmContext> build_context(
    const std::vector<uint8_t>& seed,
    MemoryMode mode) const = 0;
};

std::unique_ptr<Algorithm> make_algorithm(AlgorithmKind kind, const HashingConfig& config);

// Backend availability in this build.
bool algorithm_backend_available(AlgorithmKind kind);

} // namespace rxminer
