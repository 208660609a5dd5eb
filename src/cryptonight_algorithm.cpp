#include "rxminer/cryptonight_algorithm.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#ifdef RXMINER_HAVE_CNCRYPTO
extern "C" {
#include <crypto/hash-ops.h>
}
#endif

namespace rxminer {

namespace {

#ifdef RXMINER_HAVE_CNCRYPTO

// Monero's cn_slow_hash variant numbers.
constexpr int kVariantV7 = 1;
constexpr int kVariantR = 4;

class CryptoNightContext;

class CryptoNightEngine final : public HashEngine {
public:
  CryptoNightEngine(std::shared_ptr<const AlgorithmContext> context, int variant)
    : context_(std::move(context)), variant_(variant) {}

  Digest hash(const BlobTemplate& blob, uint64_t nonce) override {
    encode_hash_input(blob, nonce, &input_);
    Digest out;
    cn_slow_hash(input_.data(), input_.size(), reinterpret_cast<char*>(out.bytes.data()), variant_, 0, blob.height);
    return out;
  }

private:
  std::shared_ptr<const AlgorithmContext> context_;
  int variant_;
  std::vector<uint8_t> input_;
};

class CryptoNightContext final : public AlgorithmContext {
public:
  CryptoNightContext(AlgorithmKind kind, std::vector<uint8_t> seed)
    : AlgorithmContext(kind, std::move(seed), MemoryMode::Fast) {}

  std::unique_ptr<HashEngine> new_engine() const override {
    return std::make_unique<CryptoNightEngine>(
      shared_from_this(),
      kind() == AlgorithmKind::CryptoNightR ? kVariantR : kVariantV7);
  }

  HashingRuntimeProfile runtime_profile() const override {
    HashingRuntimeProfile profile;
    profile.hard_aes = true;
    profile.memory_bytes = 2ULL * 1024ULL * 1024ULL;
    return profile;
  }
};

#endif

} // namespace

CryptoNightAlgorithm::CryptoNightAlgorithm(AlgorithmKind kind) : kind_(kind) {
  if (kind_ == AlgorithmKind::RandomX) {
    throw ContextInitError("CryptoNightAlgorithm constructed for RandomX");
  }
}

bool cryptonight_backend_available() {
#ifdef RXMINER_HAVE_CNCRYPTO
  return true;
#else
  return false;
#endif
}

std::shared_ptr<const AlgorithmContext> CryptoNightAlgorithm::build_context(
  const std::vector<uint8_t>& seed,
  MemoryMode mode) const {
#ifdef RXMINER_HAVE_CNCRYPTO
  if (mode == MemoryMode::Light) {
    log_debug("cryptonight", "light mode has no effect on CryptoNight");
  }
  return std::make_shared<CryptoNightContext>(kind_, seed);
#else
  (void)seed;
  (void)mode;
  throw ContextInitError(
    std::string(algorithm_name(kind_)) + " support is not available in this build (libcncrypto not found)");
#endif
}

} // namespace rxminer
