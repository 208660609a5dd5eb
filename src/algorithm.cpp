#include "rxminer/algorithm.hpp"

#include "rxminer/cryptonight_algorithm.hpp"
#include "rxminer/log.hpp"
#include "rxminer/randomx_algorithm.hpp"

namespace rxminer {

std::unique_ptr<Algorithm> make_algorithm(AlgorithmKind kind, const HashingConfig& config) {
  if (algorithm_deprecated(kind)) {
    log_warn("algorithm", std::string(algorithm_name(kind)) + " is deprecated and kept for legacy chains only");
  }
  switch (kind) {
    case AlgorithmKind::RandomX:
      return std::make_unique<RandomXAlgorithm>(config);
    case AlgorithmKind::CryptoNightV7:
    case AlgorithmKind::CryptoNightR:
      return std::make_unique<CryptoNightAlgorithm>(kind);
  }
  return nullptr;
}

bool algorithm_backend_available(AlgorithmKind kind) {
  return kind == AlgorithmKind::RandomX ? randomx_backend_available() : cryptonight_backend_available();
}

} // namespace rxminer
