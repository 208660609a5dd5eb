#include "rxminer/json.hpp"

#include <gtest/gtest.h>

#include <string>

namespace rxminer {
namespace {

TEST(JsonTest, ParsesNestedDocument) {
  const JsonValue doc = parse_json(R"({
    "id": 7,
    "result": {"status": "OK", "job": {"target": "b88d0600", "height": 3100000}},
    "list": [1, -2, 3.5, true, null],
    "error": null
  })");

  ASSERT_TRUE(doc.is_object());
  EXPECT_EQ(doc.find("id")->as_uint64(), 7U);
  const JsonValue* job = doc.find("result")->find("job");
  ASSERT_NE(job, nullptr);
  EXPECT_EQ(job->find("target")->as_string(), "b88d0600");
  EXPECT_EQ(job->find("height")->as_uint64(), 3100000U);

  const auto& list = doc.find("list")->as_array();
  ASSERT_EQ(list.size(), 5U);
  EXPECT_EQ(list[1].as_int64(), -2);
  EXPECT_DOUBLE_EQ(list[2].as_double(), 3.5);
  EXPECT_TRUE(list[3].as_bool());
  EXPECT_TRUE(list[4].is_null());
  EXPECT_TRUE(doc.find("error")->is_null());
  EXPECT_EQ(doc.find("missing"), nullptr);
}

TEST(JsonTest, StringEscapes) {
  const JsonValue doc = parse_json(R"(["a\"b\\c\n", "\u00e9", "\ud83d\ude00"])");
  const auto& items = doc.as_array();
  EXPECT_EQ(items[0].as_string(), "a\"b\\c\n");
  EXPECT_EQ(items[1].as_string(), "\xC3\xA9");
  EXPECT_EQ(items[2].as_string(), "\xF0\x9F\x98\x80");
}

TEST(JsonTest, RejectsMalformedInput) {
  EXPECT_THROW(parse_json(""), JsonError);
  EXPECT_THROW(parse_json("{"), JsonError);
  EXPECT_THROW(parse_json("{\"a\" 1}"), JsonError);
  EXPECT_THROW(parse_json("[1,]"), JsonError);
  EXPECT_THROW(parse_json("{} x"), JsonError);
  EXPECT_THROW(parse_json("01"), JsonError);
  EXPECT_THROW(parse_json("\"\\ud800\""), JsonError);
  EXPECT_THROW(parse_json(std::string(200, '[') + std::string(200, ']')), JsonError);
}

TEST(JsonTest, TypeMismatchThrows) {
  const JsonValue doc = parse_json(R"({"n": -1, "s": "x"})");
  EXPECT_THROW(doc.find("n")->as_uint64(), JsonError);
  EXPECT_THROW(doc.find("s")->as_int64(), JsonError);
  EXPECT_THROW(doc.find("s")->as_array(), JsonError);
}

TEST(JsonTest, MemberAccessors) {
  const JsonValue doc = parse_json(R"({"name": "rig", "threads": 4, "pin": false, "bad": "4", "none": null})");
  EXPECT_EQ(json_string_member(doc, "name"), "rig");
  EXPECT_EQ(json_uint_member(doc, "threads"), 4U);
  EXPECT_EQ(json_bool_member(doc, "pin"), false);
  EXPECT_FALSE(json_string_member(doc, "absent").has_value());
  EXPECT_FALSE(json_uint_member(doc, "none").has_value());
  EXPECT_THROW(json_uint_member(doc, "bad"), JsonError);
  EXPECT_THROW(json_string_member(doc, "threads"), JsonError);
}

TEST(JsonTest, SerializesCompactly) {
  JsonValue::object params;
  params["id"] = JsonValue("abc");
  params["nonce"] = JsonValue("0a000000");
  JsonValue::object request;
  request["id"] = JsonValue(uint64_t{2});
  request["method"] = JsonValue("submit");
  request["params"] = JsonValue(std::move(params));

  EXPECT_EQ(
    to_json(JsonValue(std::move(request))),
    R"({"id":2,"method":"submit","params":{"id":"abc","nonce":"0a000000"}})");
  EXPECT_EQ(to_json(JsonValue("tab\there")), R"("tab\there")");
}

TEST(JsonTest, PrettyOutputParsesBack) {
  const JsonValue doc = parse_json(R"({"a": [1, 2], "b": {"c": "d"}})");
  const std::string pretty = to_json(doc, true);
  EXPECT_NE(pretty.find('\n'), std::string::npos);
  EXPECT_EQ(to_json(parse_json(pretty)), to_json(doc));
}

} // namespace
} // namespace rxminer
