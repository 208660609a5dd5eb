#pragma once

#include "rxminer/algorithm.hpp"

namespace rxminer {

constexpr uint64_t kRandomXFastModeBytes = 2080ULL * 1024ULL * 1024ULL;
constexpr uint64_t kRandomXLightModeBytes = 256ULL * 1024ULL * 1024ULL;

class RandomXAlgorithm final : public Algorithm {
public:
  explicit RandomXAlgorithm(HashingConfig config);

  AlgorithmKind kind() const override { return AlgorithmKind::RandomX; }
  std::shared_ptr<const AlgorithmContext> build_context(
    const std::vector<uint8_t>& seed,
    MemoryMode mode) const override;

private:
  HashingConfig config_;
};

bool randomx_backend_available();

} // namespace rxminer
