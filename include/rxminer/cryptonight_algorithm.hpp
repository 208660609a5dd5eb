#pragma once

#include "rxminer/algorithm.hpp"

namespace rxminer {

// CryptoNight variants kept for older coins. The per-engine scratchpad is 2 MiB.
class CryptoNightAlgorithm final : public Algorithm {
public:
  explicit CryptoNightAlgorithm(AlgorithmKind kind);

  AlgorithmKind kind() const override { return kind_; }
  std::shared_ptr<const AlgorithmContext> build_context(
    const std::vector<uint8_t>& seed,
    MemoryMode mode) const override;

private:
  AlgorithmKind kind_;
};

bool cryptonight_backend_available();

} // namespace rxminer
