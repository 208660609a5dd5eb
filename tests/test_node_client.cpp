#include "rxminer/node_client.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/node_job_source.hpp"

#include <gtest/gtest.h>

#include <string>

namespace rxminer {
namespace {

JsonValue template_result(uint64_t difficulty = 250000) {
  return parse_json(
    R"({"blocktemplate_blob":")" + std::string(44, '0') + std::string(44, '1') +
    R"(","blockhashing_blob":")" + std::string(88, 'c') +
    R"(","difficulty":)" + std::to_string(difficulty) +
    R"(,"height":3100001,"seed_hash":")" + std::string(64, 'd') +
    R"(","prev_hash":"abcd","status":"OK"})");
}

TEST(Base64Test, EncodesWithPadding) {
  EXPECT_EQ(base64_encode(""), "");
  EXPECT_EQ(base64_encode("f"), "Zg==");
  EXPECT_EQ(base64_encode("fo"), "Zm8=");
  EXPECT_EQ(base64_encode("foo"), "Zm9v");
  EXPECT_EQ(base64_encode("user:pass"), "dXNlcjpwYXNz");
}

TEST(HttpTest, PostCarriesBodyAndOptionalAuth) {
  Endpoint endpoint;
  endpoint.host = "127.0.0.1";
  endpoint.port = 18081;
  endpoint.path = "/json_rpc";

  const std::string anonymous = build_http_post(endpoint, "{}", "", "");
  EXPECT_EQ(anonymous.rfind("POST /json_rpc HTTP/1.1\r\n", 0), 0U);
  EXPECT_NE(anonymous.find("Host: 127.0.0.1:18081\r\n"), std::string::npos);
  EXPECT_NE(anonymous.find("Content-Length: 2\r\n"), std::string::npos);
  EXPECT_EQ(anonymous.find("Authorization"), std::string::npos);
  EXPECT_EQ(anonymous.substr(anonymous.size() - 6), "\r\n\r\n{}");

  const std::string authed = build_http_post(endpoint, "{}", "user", "pass");
  EXPECT_NE(authed.find("Authorization: Basic dXNlcjpwYXNz\r\n"), std::string::npos);
}

TEST(HttpTest, ContentLengthBody) {
  HttpResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response(
    "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 5\r\n\r\nhelloEXTRA", &response, &error))
    << error;
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.reason, "OK");
  EXPECT_EQ(response.headers["content-type"], "application/json");
  EXPECT_EQ(response.body, "hello");
}

TEST(HttpTest, ChunkedBody) {
  HttpResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response(
    "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\n{\"a\"\r\n3;ext=1\r\n:1}\r\n0\r\n\r\n", &response, &error))
    << error;
  EXPECT_EQ(response.body, "{\"a\":1}");
}

TEST(HttpTest, BodyUntilCloseAndErrors) {
  HttpResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response("HTTP/1.0 401 Unauthorized\r\n\r\ndenied", &response, &error));
  EXPECT_EQ(response.status, 401);
  EXPECT_EQ(response.reason, "Unauthorized");
  EXPECT_EQ(response.body, "denied");

  EXPECT_FALSE(parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort", &response, &error));
  EXPECT_EQ(error, "truncated HTTP body");
  EXPECT_FALSE(parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 1\r\n", &response, &error));
  EXPECT_FALSE(parse_http_response("SSH-2.0-OpenSSH\r\n\r\n", &response, &error));
  EXPECT_FALSE(parse_http_response(
    "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n", &response, &error));
}

TEST(BlockTemplateTest, ParsesMonerodResult) {
  const BlockTemplate tpl = parse_block_template(template_result());
  EXPECT_EQ(tpl.template_blob.size(), 44U);
  EXPECT_EQ(tpl.hashing_blob.size(), 44U);
  EXPECT_EQ(tpl.difficulty, 250000U);
  EXPECT_EQ(tpl.height, 3100001U);
  EXPECT_EQ(tpl.seed.size(), 32U);
  EXPECT_EQ(tpl.prev_hash, "abcd");
}

TEST(BlockTemplateTest, RejectsIncompleteResults) {
  EXPECT_THROW(parse_block_template(parse_json("[]")), ProtocolError);
  EXPECT_THROW(parse_block_template(parse_json(R"({"blocktemplate_blob":"00"})")), ProtocolError);
  EXPECT_THROW(parse_block_template(template_result(0)), ProtocolError);
  EXPECT_THROW(
    parse_block_template(parse_json(R"({"blocktemplate_blob":"zz","difficulty":1,"height":1})")), ProtocolError);
  EXPECT_THROW(
    parse_block_template(parse_json(R"({"blocktemplate_blob":"0011","difficulty":1,"height":1})")), ProtocolError);
}

TEST(NodeJobTest, HashesTheHashingBlobAndSubmitsTheTemplate) {
  const BlockTemplate tpl = parse_block_template(template_result());
  const Job job = NodeJobSource::to_job(3, tpl);
  EXPECT_EQ(job.id, 3U);
  EXPECT_EQ(job.blob.bytes, tpl.hashing_blob);
  EXPECT_EQ(job.target, Target::from_difficulty(250000));
  EXPECT_EQ(job.nonce_end, 1ULL << 32U);
  EXPECT_EQ(job.height, 3100001U);

  const auto block = NodeJobSource::block_with_nonce(tpl, 0x0000000104030201ULL);
  ASSERT_EQ(block.size(), tpl.template_blob.size());
  EXPECT_EQ(block[38], tpl.template_blob[38]);
  EXPECT_EQ(block[39], 0x01);
  EXPECT_EQ(block[40], 0x02);
  EXPECT_EQ(block[41], 0x03);
  EXPECT_EQ(block[42], 0x04);
}

} // namespace
} // namespace rxminer
