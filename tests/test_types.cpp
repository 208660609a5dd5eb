#include "rxminer/types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace rxminer {
namespace {

Digest digest_with_top_word(uint64_t top) {
  Digest digest;
  for (size_t i = 0; i < 8; ++i) {
    digest.bytes[24 + i] = static_cast<uint8_t>((top >> (8U * i)) & 0xFFU);
  }
  return digest;
}

TEST(TargetTest, MeetsTargetIsStrictlyBelow) {
  const Target target = Target::from_compact(0x1000);
  EXPECT_TRUE(meets_target(digest_with_top_word(0x0FFF), target));
  EXPECT_FALSE(meets_target(digest_with_top_word(0x1000), target));
  EXPECT_FALSE(meets_target(digest_with_top_word(0x1001), target));

  Digest zero;
  EXPECT_FALSE(meets_target(zero, Target::zero()));
  EXPECT_TRUE(meets_target(zero, Target::max()));

  Digest ones;
  ones.bytes.fill(0xFF);
  EXPECT_FALSE(meets_target(ones, Target::max()));
}

TEST(TargetTest, LowWordsBreakTiesOnTheTopWord) {
  const Target target = Target::from_compact(0x1000);
  Digest digest = digest_with_top_word(0x1000);
  digest.bytes[0] = 1;
  EXPECT_FALSE(meets_target(digest, target));

  Digest below = digest_with_top_word(0x0FFF);
  below.bytes.fill(0xFF);
  for (size_t i = 0; i < 8; ++i) {
    below.bytes[24 + i] = i == 0 ? 0xFF : (i == 1 ? 0x0F : 0x00);
  }
  EXPECT_TRUE(meets_target(below, target));
}

TEST(TargetTest, LargerTargetAcceptsEverythingASmallerOneDoes) {
  const Target small = Target::from_difficulty(5000);
  const Target large = Target::from_difficulty(50);
  ASSERT_TRUE(small < large);
  for (uint64_t top = 0; top < 1U << 20U; top += 997) {
    const Digest digest = digest_with_top_word(top << 40U);
    if (meets_target(digest, small)) {
      EXPECT_TRUE(meets_target(digest, large));
    }
  }
}

TEST(TargetTest, FromDifficulty) {
  EXPECT_EQ(Target::from_difficulty(0), Target::max());
  EXPECT_EQ(Target::from_difficulty(1), Target::max());

  const Target two = Target::from_difficulty(2);
  EXPECT_EQ(two.limbs()[3], UINT64_MAX >> 1U);
  EXPECT_EQ(two.limbs()[0], UINT64_MAX);

  const Target thousand = Target::from_difficulty(1000);
  EXPECT_EQ(thousand.limbs()[3], UINT64_MAX / 1000);
  EXPECT_NEAR(thousand.difficulty(), 1000.0, 1e-6);
}

TEST(TargetTest, FromCompactAndBytes) {
  const Target compact = Target::from_compact(0x00000000FFFFFFFFULL);
  EXPECT_EQ(compact.limbs()[3], 0xFFFFFFFFULL);
  EXPECT_EQ(compact.limbs()[0], 0U);

  std::array<uint8_t, 32> be{};
  be[0] = 0x01;
  be[31] = 0x02;
  const Target from_be = Target::from_be_bytes(be);
  EXPECT_EQ(from_be.limbs()[3], 0x0100000000000000ULL);
  EXPECT_EQ(from_be.limbs()[0], 0x02U);
  EXPECT_EQ(from_be.to_hex_be().substr(0, 2), "01");
  EXPECT_EQ(Target::from_le_bytes(from_be.to_le_bytes()), from_be);

  EXPECT_TRUE(Target::zero().is_zero());
  EXPECT_EQ(Target::zero().difficulty(), 0.0);
}

TEST(TargetTest, SaturatedDifficultyClampsHardTargets) {
  // 2^192 as a target is difficulty 2^64, one past what fits in a uint64_t.
  EXPECT_EQ(Target::from_compact(1).saturated_difficulty(), UINT64_MAX);
  EXPECT_EQ(Target::zero().saturated_difficulty(), 0U);
  EXPECT_EQ(Target::max().saturated_difficulty(), 1U);
  EXPECT_NEAR(static_cast<double>(Target::from_difficulty(1000).saturated_difficulty()), 1000.0, 1.0);
}

TEST(HashInputTest, EmbeddedNonceOverwritesFourBytes) {
  BlobTemplate blob;
  blob.bytes.assign(43, 0xAA);
  blob.nonce_offset = 39;

  std::vector<uint8_t> out;
  encode_hash_input(blob, 0x1122334455667788ULL, &out);
  ASSERT_EQ(out.size(), 43U);
  EXPECT_EQ(hash_input_size(blob), 43U);
  EXPECT_EQ(out[38], 0xAA);
  EXPECT_EQ(out[39], 0x88);
  EXPECT_EQ(out[40], 0x77);
  EXPECT_EQ(out[41], 0x66);
  EXPECT_EQ(out[42], 0x55);
}

TEST(HashInputTest, AppendedNonceAddsEightBytes) {
  BlobTemplate blob;
  blob.bytes = {1, 2, 3};

  std::vector<uint8_t> out;
  encode_hash_input(blob, 0x0102030405060708ULL, &out);
  ASSERT_EQ(out.size(), 11U);
  EXPECT_EQ(hash_input_size(blob), 11U);
  EXPECT_EQ(out[0], 1);
  EXPECT_EQ(out[3], 0x08);
  EXPECT_EQ(out[10], 0x01);
}

TEST(HashInputTest, OffsetOutsideTheBlobThrows) {
  BlobTemplate blob;
  blob.bytes.assign(42, 0);
  blob.nonce_offset = 39;
  std::vector<uint8_t> out;
  EXPECT_THROW(encode_hash_input(blob, 1, &out), std::out_of_range);
}

TEST(AlgorithmNameTest, AliasesResolve) {
  EXPECT_EQ(parse_algorithm_kind("randomx"), AlgorithmKind::RandomX);
  EXPECT_EQ(parse_algorithm_kind("RX/0"), AlgorithmKind::RandomX);
  EXPECT_EQ(parse_algorithm_kind("cn/1"), AlgorithmKind::CryptoNightV7);
  EXPECT_EQ(parse_algorithm_kind("cryptonight-r"), AlgorithmKind::CryptoNightR);
  EXPECT_FALSE(parse_algorithm_kind("sha256d").has_value());

  EXPECT_STREQ(algorithm_name(AlgorithmKind::CryptoNightV7), "cryptonight-v7");
  EXPECT_FALSE(algorithm_deprecated(AlgorithmKind::RandomX));
  EXPECT_TRUE(algorithm_deprecated(AlgorithmKind::CryptoNightR));
}

TEST(HexTest, ParseAndFormat) {
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(parse_hex("00ffA1", &bytes));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x00, 0xFF, 0xA1}));
  EXPECT_EQ(to_hex(bytes), "00ffa1");
  EXPECT_FALSE(parse_hex("abc", &bytes));
  EXPECT_FALSE(parse_hex("zz", &bytes));
  EXPECT_EQ(bytes.size(), 3U);
}

} // namespace
} // namespace rxminer
