#include "rxminer/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace rxminer {

namespace {

std::string lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

inline void write_le(uint8_t* dest, uint64_t value, size_t width) {
#if defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
  std::memcpy(dest, &value, width);
#else
  for (size_t i = 0; i < width; ++i) {
    dest[i] = static_cast<uint8_t>((value >> (8U * i)) & 0xFFU);
  }
#endif
}

uint64_t read_le64(const uint8_t* src) {
  uint64_t out = 0;
  for (size_t i = 0; i < 8; ++i) {
    out |= static_cast<uint64_t>(src[i]) << (8U * i);
  }
  return out;
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

std::optional<AlgorithmKind> parse_algorithm_kind(std::string_view name) {
  const std::string value = lower(name);
  if (value == "randomx" || value == "rx" || value == "rx/0") {
    return AlgorithmKind::RandomX;
  }
  if (value == "cryptonight-v7" || value == "cnv7" || value == "cn/1" || value == "cryptonight/1") {
    return AlgorithmKind::CryptoNightV7;
  }
  if (value == "cryptonight-r" || value == "cnr" || value == "cn/r" || value == "cryptonight/r") {
    return AlgorithmKind::CryptoNightR;
  }
  return std::nullopt;
}

const char* algorithm_name(AlgorithmKind kind) {
  switch (kind) {
    case AlgorithmKind::RandomX: return "randomx";
    case AlgorithmKind::CryptoNightV7: return "cryptonight-v7";
    case AlgorithmKind::CryptoNightR: return "cryptonight-r";
  }
  return "unknown";
}

bool algorithm_deprecated(AlgorithmKind kind) {
  return kind != AlgorithmKind::RandomX;
}

Target Target::zero() { return Target{}; }

Target Target::max() {
  Target t;
  t.limbs_.fill(UINT64_MAX);
  return t;
}

Target Target::from_le_bytes(const std::array<uint8_t, 32>& bytes) {
  Target t;
  for (size_t i = 0; i < 4; ++i) {
    t.limbs_[i] = read_le64(bytes.data() + i * 8);
  }
  return t;
}

Target Target::from_be_bytes(const std::array<uint8_t, 32>& bytes) {
  std::array<uint8_t, 32> reversed{};
  std::reverse_copy(bytes.begin(), bytes.end(), reversed.begin());
  return from_le_bytes(reversed);
}

Target Target::from_difficulty(uint64_t difficulty) {
  if (difficulty <= 1) {
    return max();
  }
  Target t;
  unsigned __int128 remainder = 0;
  for (size_t i = 4; i-- > 0;) {
    const unsigned __int128 part = (remainder << 64U) | UINT64_MAX;
    t.limbs_[i] = static_cast<uint64_t>(part / difficulty);
    remainder = part % difficulty;
  }
  return t;
}

Target Target::from_compact(uint64_t top_word) {
  Target t;
  t.limbs_[3] = top_word;
  return t;
}

std::array<uint8_t, 32> Target::to_le_bytes() const {
  std::array<uint8_t, 32> out{};
  for (size_t i = 0; i < 4; ++i) {
    write_le(out.data() + i * 8, limbs_[i], 8);
  }
  return out;
}

std::string Target::to_hex_be() const {
  auto bytes = to_le_bytes();
  std::reverse(bytes.begin(), bytes.end());
  return to_hex(bytes.data(), bytes.size());
}

double Target::difficulty() const {
  if (is_zero()) {
    return 0.0;
  }
  double value = 0.0;
  for (size_t i = 4; i-- > 0;) {
    value = value * 18446744073709551616.0 + static_cast<double>(limbs_[i]);
  }
  return std::ldexp(1.0, 256) / value;
}

uint64_t Target::saturated_difficulty() const {
  const double value = difficulty();
  if (value >= 18446744073709551616.0) {
    return UINT64_MAX;
  }
  return static_cast<uint64_t>(value);
}

bool Target::is_zero() const {
  return std::all_of(limbs_.begin(), limbs_.end(), [](uint64_t limb) { return limb == 0; });
}

bool Target::operator<(const Target& other) const {
  for (size_t i = 4; i-- > 0;) {
    if (limbs_[i] != other.limbs_[i]) {
      return limbs_[i] < other.limbs_[i];
    }
  }
  return false;
}

bool meets_target(const Digest& digest, const Target& target) {
  const auto& limbs = target.limbs();
  for (size_t i = 4; i-- > 0;) {
    const uint64_t word = read_le64(digest.bytes.data() + i * 8);
    if (word != limbs[i]) {
      return word < limbs[i];
    }
  }
  return false;
}

uint32_t hash_input_size(const BlobTemplate& blob) {
  const auto size = static_cast<uint32_t>(blob.bytes.size());
  return blob.nonce_offset ? size : size + 8U;
}

void encode_hash_input(const BlobTemplate& blob, uint64_t nonce, std::vector<uint8_t>* out) {
  out->resize(hash_input_size(blob));
  if (!blob.bytes.empty()) {
    std::memcpy(out->data(), blob.bytes.data(), blob.bytes.size());
  }
  if (blob.nonce_offset) {
    if (static_cast<size_t>(*blob.nonce_offset) + 4U > blob.bytes.size()) {
      throw std::out_of_range("nonce offset outside of blob");
    }
    write_le(out->data() + *blob.nonce_offset, nonce & 0xFFFFFFFFULL, 4);
  } else {
    write_le(out->data() + blob.bytes.size(), nonce, 8);
  }
}

std::string to_hex(const uint8_t* data, size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out[i * 2] = kDigits[data[i] >> 4U];
    out[i * 2 + 1] = kDigits[data[i] & 0x0FU];
  }
  return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
  return to_hex(data.data(), data.size());
}

std::string to_hex(const Digest& digest) {
  return to_hex(digest.bytes.data(), digest.bytes.size());
}

bool parse_hex(std::string_view hex, std::vector<uint8_t>* out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  std::vector<uint8_t> bytes(hex.size() / 2);
  for (size_t i = 0; i < bytes.size(); ++i) {
    const int hi = hex_digit(hex[i * 2]);
    const int lo = hex_digit(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  *out = std::move(bytes);
  return true;
}

} // namespace rxminer
