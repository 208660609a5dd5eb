#include "rxminer/stratum_client.hpp"

#include "rxminer/pool_job_source.hpp"

#include <gtest/gtest.h>

#include <string>

namespace rxminer {
namespace {

// 76-byte hashing blob.
const std::string kBlob = "0e0e" + std::string(148, 'a');

StratumMessage parse(const std::string& line) {
  StratumMessage msg;
  std::string error;
  EXPECT_TRUE(parse_stratum_message(parse_json(line), &msg, &error)) << error;
  return msg;
}

TEST(StratumTargetTest, FourByteCompactTarget) {
  Target target;
  ASSERT_TRUE(parse_stratum_target("b88d0600", &target));
  EXPECT_EQ(target.limbs()[3], UINT64_MAX / 10000U);
  EXPECT_EQ(target.limbs()[0], 0U);
  EXPECT_NEAR(target.difficulty(), 10000.0, 1.0);
}

TEST(StratumTargetTest, EightByteCompactTarget) {
  Target target;
  ASSERT_TRUE(parse_stratum_target("0000000000100000", &target));
  EXPECT_EQ(target.limbs()[3], 0x0000100000000000ULL);
}

TEST(StratumTargetTest, FullBigEndianTarget) {
  Target target;
  const std::string hex = "00000000ffff" + std::string(52, '0');
  ASSERT_TRUE(parse_stratum_target(hex, &target));
  EXPECT_EQ(target.limbs()[3], 0x00000000FFFF0000ULL);
  EXPECT_EQ(target.to_hex_be(), hex);
}

TEST(StratumTargetTest, RejectsZeroAndOddSizes) {
  Target target;
  EXPECT_FALSE(parse_stratum_target("00000000", &target));
  EXPECT_FALSE(parse_stratum_target("0011223344", &target));
  EXPECT_FALSE(parse_stratum_target("xyz0", &target));
  EXPECT_FALSE(parse_stratum_target(std::string(64, '0'), &target));
}

TEST(StratumMessageTest, JobNotification) {
  const auto msg = parse(
    R"({"jsonrpc":"2.0","method":"job","params":{"job_id":"j-17","blob":")" + kBlob +
    R"(","target":"b88d0600","seed_hash":")" + std::string(64, 'a') +
    R"(","height":3100000,"algo":"rx/0"}})");

  ASSERT_EQ(msg.kind, StratumMessage::Kind::Job);
  EXPECT_EQ(msg.job.job_id, "j-17");
  EXPECT_EQ(msg.job.blob.size(), kBlob.size() / 2);
  EXPECT_EQ(msg.job.nonce_offset, 39U);
  EXPECT_EQ(msg.job.seed.size(), 32U);
  EXPECT_EQ(msg.job.height, 3100000U);
  EXPECT_EQ(msg.job.algorithm, AlgorithmKind::RandomX);
}

TEST(StratumMessageTest, JobWithDifficultyInsteadOfTarget) {
  const auto msg = parse(
    R"({"method":"job","params":{"job_id":"d","blob":")" + kBlob + R"(","difficulty":5000}})");
  ASSERT_EQ(msg.kind, StratumMessage::Kind::Job);
  EXPECT_EQ(msg.job.target, Target::from_difficulty(5000));
  EXPECT_FALSE(msg.job.algorithm.has_value());
}

TEST(StratumMessageTest, MalformedJobsAreRejected) {
  StratumMessage msg;
  std::string error;
  EXPECT_FALSE(parse_stratum_message(
    parse_json(R"({"method":"job","params":{"job_id":"x","blob":"00ff","target":"b88d0600"}})"), &msg, &error));
  EXPECT_EQ(error, "job blob is too short for its nonce");

  EXPECT_FALSE(parse_stratum_message(
    parse_json(R"({"method":"job","params":{"job_id":"x","blob":")" + kBlob + R"("}})"), &msg, &error));
  EXPECT_EQ(error, "job has no target");

  EXPECT_FALSE(parse_stratum_message(
    parse_json(R"({"method":"job","params":{"job_id":"x","blob":")" + kBlob +
               R"(","target":"b88d0600","algo":"kawpow"}})"), &msg, &error));
  EXPECT_NE(error.find("kawpow"), std::string::npos);

  EXPECT_FALSE(parse_stratum_message(parse_json(R"({"result":true})"), &msg, &error));
  EXPECT_FALSE(parse_stratum_message(parse_json("[1,2]"), &msg, &error));
}

TEST(StratumMessageTest, SubmitResponses) {
  const auto accepted = parse(R"({"id":4,"jsonrpc":"2.0","error":null,"result":{"status":"OK"}})");
  EXPECT_EQ(accepted.kind, StratumMessage::Kind::Response);
  EXPECT_EQ(accepted.id, 4U);
  EXPECT_TRUE(accepted.ok);

  const auto rejected = parse(R"({"id":"5","error":{"code":-1,"message":"Low difficulty share"}})");
  EXPECT_EQ(rejected.id, 5U);
  EXPECT_FALSE(rejected.ok);
  EXPECT_EQ(rejected.error, "Low difficulty share");

  const auto keepalive = parse(R"({"id":6,"result":{"status":"KEEPALIVED"}})");
  EXPECT_TRUE(keepalive.ok);

  const auto odd_status = parse(R"({"id":7,"result":{"status":"Invalid job id"}})");
  EXPECT_FALSE(odd_status.ok);
  EXPECT_EQ(odd_status.error, "Invalid job id");

  const auto plain_false = parse(R"({"id":8,"result":false})");
  EXPECT_FALSE(plain_false.ok);
}

TEST(StratumMessageTest, UnknownMethodsAreIgnored) {
  const auto msg = parse(R"({"method":"mining.set_extranonce","params":{}})");
  EXPECT_EQ(msg.kind, StratumMessage::Kind::Other);
}

TEST(StratumSubmitTest, NonceIsLittleEndianLow32Bits) {
  EXPECT_EQ(format_submit_nonce(0), "00000000");
  EXPECT_EQ(format_submit_nonce(0x12345678ULL), "78563412");
  EXPECT_EQ(format_submit_nonce(0xABCDEF0000000001ULL), "01000000");
}

TEST(PoolJobTest, StratumJobBecomesAnEmbeddedNonceJob) {
  const auto msg = parse(
    R"({"method":"job","params":{"job_id":"j-1","blob":")" + kBlob +
    R"(","target":"b88d0600","seed_hash":")" + std::string(64, 'b') + R"(","height":12}})");

  const Job job = PoolJobSource::to_job(9, msg.job);
  EXPECT_EQ(job.id, 9U);
  EXPECT_EQ(job.upstream_id, "j-1");
  ASSERT_TRUE(job.blob.nonce_offset.has_value());
  EXPECT_EQ(*job.blob.nonce_offset, 39U);
  EXPECT_EQ(job.nonce_start, 0U);
  EXPECT_EQ(job.nonce_end, 1ULL << 32U);
  EXPECT_EQ(job.height, 12U);
  EXPECT_EQ(job.target, msg.job.target);
  EXPECT_EQ(hash_input_size(job.blob), job.blob.bytes.size());
}

} // namespace
} // namespace rxminer
