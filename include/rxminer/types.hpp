#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rxminer {

enum class AlgorithmKind {
  RandomX,
  CryptoNightV7,
  CryptoNightR,
};

enum class MemoryMode {
  Fast,
  Light,
};

std::optional<AlgorithmKind> parse_algorithm_kind(std::string_view name);
const char* algorithm_name(AlgorithmKind kind);
bool algorithm_deprecated(AlgorithmKind kind);

struct Digest {
  std::array<uint8_t, 32> bytes{};

  bool operator==(const Digest& other) const = default;
};

// 256-bit unsigned threshold. limbs_[0] is the least significant word.
class Target {
public:
  Target() = default;

  static Target zero();
  static Target max();
  static Target from_le_bytes(const std::array<uint8_t, 32>& bytes);
  static Target from_be_bytes(const std::array<uint8_t, 32>& bytes);
  // floor((2^256 - 1) / difficulty); difficulty 0 and 1 both give max().
  static Target from_difficulty(uint64_t difficulty);
  // Compact pool target: a 64-bit little-endian threshold on the top word.
  static Target from_compact(uint64_t top_word);

  std::array<uint8_t, 32> to_le_bytes() const;
  std::string to_hex_be() const;
  // Expected hashes per solution, rounded to the top 64 significant bits.
  double difficulty() const;
  // difficulty() truncated to an integer, saturating at UINT64_MAX.
  uint64_t saturated_difficulty() const;
  bool is_zero() const;

  bool operator==(const Target& other) const = default;
  bool operator<(const Target& other) const;

  const std::array<uint64_t, 4>& limbs() const { return limbs_; }

private:
  std::array<uint64_t, 4> limbs_{};
};

// digest, read as a little-endian 256-bit integer, is strictly below target.
bool meets_target(const Digest& digest, const Target& target);

// Hashing input before the nonce is applied. With nonce_offset set, the low
// 32 bits of the nonce are written little-endian at that offset. Otherwise
// the full 64-bit nonce is appended little-endian.
struct BlobTemplate {
  std::vector<uint8_t> bytes;
  std::optional<uint32_t> nonce_offset;
  uint64_t height = 0;
};

void encode_hash_input(const BlobTemplate& blob, uint64_t nonce, std::vector<uint8_t>* out);
uint32_t hash_input_size(const BlobTemplate& blob);

struct Job {
  uint64_t id = 0;
  std::string upstream_id;
  BlobTemplate blob;
  Target target;
  std::vector<uint8_t> seed;
  uint64_t height = 0;
  uint64_t nonce_start = 0;
  uint64_t nonce_end = UINT64_MAX;
  std::optional<AlgorithmKind> algorithm;
};

struct NonceRange {
  uint64_t start = 0;
  uint32_t count = 0;
};

struct Share {
  uint64_t job_id = 0;
  uint64_t nonce = 0;
  Digest digest;
};

std::string to_hex(const uint8_t* data, size_t size);
std::string to_hex(const std::vector<uint8_t>& data);
std::string to_hex(const Digest& digest);
bool parse_hex(std::string_view hex, std::vector<uint8_t>* out);

} // namespace rxminer
