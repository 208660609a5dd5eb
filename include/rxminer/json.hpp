#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rxminer {

class JsonError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class JsonValue {
public:
  using array = std::vector<JsonValue>;
  using object = std::map<std::string, JsonValue, std::less<>>;
  using storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string, array, object>;

  JsonValue();
  JsonValue(std::nullptr_t value);
  JsonValue(bool value);
  JsonValue(int32_t value);
  JsonValue(int64_t value);
  JsonValue(uint32_t value);
  JsonValue(uint64_t value);
  JsonValue(double value);
  JsonValue(std::string value);
  JsonValue(const char* value);
  JsonValue(array value);
  JsonValue(object value);

  bool is_null() const;
  bool is_bool() const;
  bool is_integer() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  bool as_bool() const;
  int64_t as_int64() const;
  uint64_t as_uint64() const;
  double as_double() const;
  const std::string& as_string() const;
  const array& as_array() const;
  const object& as_object() const;
  array& as_array();
  object& as_object();

  // Object member lookup; nullptr when this is not an object or the key is absent.
  const JsonValue* find(std::string_view key) const;
  JsonValue* find(std::string_view key);

  const storage& raw() const;

private:
  storage value_;
};

JsonValue parse_json(std::string_view text);
std::string to_json(const JsonValue& value, bool pretty = false, uint32_t indent = 2);

// Typed member accessors used by the config and RPC layers. They return
// std::nullopt when the key is missing and throw JsonError on a type mismatch.
std::optional<std::string> json_string_member(const JsonValue& obj, std::string_view key);
std::optional<uint64_t> json_uint_member(const JsonValue& obj, std::string_view key);
std::optional<bool> json_bool_member(const JsonValue& obj, std::string_view key);

} // namespace rxminer
