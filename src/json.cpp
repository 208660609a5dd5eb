#include "rxminer/json.hpp"

#include <charconv>
#include <cstdio>
#include <limits>
#include <type_traits>

namespace rxminer {

JsonValue::JsonValue() : value_(nullptr) {}
JsonValue::JsonValue(std::nullptr_t value) : value_(value) {}
JsonValue::JsonValue(bool value) : value_(value) {}
JsonValue::JsonValue(int32_t value) : value_(static_cast<int64_t>(value)) {}
JsonValue::JsonValue(int64_t value) : value_(value) {}
JsonValue::JsonValue(uint32_t value) : value_(static_cast<uint64_t>(value)) {}
JsonValue::JsonValue(uint64_t value) : value_(value) {}
JsonValue::JsonValue(double value) : value_(value) {}
JsonValue::JsonValue(std::string value) : value_(std::move(value)) {}
JsonValue::JsonValue(const char* value) : value_(std::string(value)) {}
JsonValue::JsonValue(array value) : value_(std::move(value)) {}
JsonValue::JsonValue(object value) : value_(std::move(value)) {}

bool JsonValue::is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
bool JsonValue::is_bool() const { return std::holds_alternative<bool>(value_); }
bool JsonValue::is_integer() const {
  return std::holds_alternative<int64_t>(value_) || std::holds_alternative<uint64_t>(value_);
}
bool JsonValue::is_number() const { return is_integer() || std::holds_alternative<double>(value_); }
bool JsonValue::is_string() const { return std::holds_alternative<std::string>(value_); }
bool JsonValue::is_array() const { return std::holds_alternative<array>(value_); }
bool JsonValue::is_object() const { return std::holds_alternative<object>(value_); }

namespace {

template <typename T>
const T& checked_get(const JsonValue::storage& value, const char* expected) {
  if (const auto* out = std::get_if<T>(&value)) {
    return *out;
  }
  throw JsonError(std::string("expected ") + expected);
}

template <typename T>
T& checked_get(JsonValue::storage& value, const char* expected) {
  if (auto* out = std::get_if<T>(&value)) {
    return *out;
  }
  throw JsonError(std::string("expected ") + expected);
}

} // namespace

bool JsonValue::as_bool() const { return checked_get<bool>(value_, "bool"); }

int64_t JsonValue::as_int64() const {
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    return *v;
  }
  if (const auto* v = std::get_if<uint64_t>(&value_)) {
    if (*v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw JsonError("number out of range for int64");
    }
    return static_cast<int64_t>(*v);
  }
  if (const auto* v = std::get_if<double>(&value_)) {
    return static_cast<int64_t>(*v);
  }
  throw JsonError("expected integer");
}

uint64_t JsonValue::as_uint64() const {
  if (const auto* v = std::get_if<uint64_t>(&value_)) {
    return *v;
  }
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    if (*v < 0) {
      throw JsonError("negative number where unsigned expected");
    }
    return static_cast<uint64_t>(*v);
  }
  if (const auto* v = std::get_if<double>(&value_)) {
    if (*v < 0.0) {
      throw JsonError("negative number where unsigned expected");
    }
    return static_cast<uint64_t>(*v);
  }
  throw JsonError("expected unsigned integer");
}

double JsonValue::as_double() const {
  return std::visit(
      [](const auto& v) -> double {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, double> || std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
          return static_cast<double>(v);
        } else {
          throw JsonError("expected number");
        }
      },
      value_);
}

const std::string& JsonValue::as_string() const { return checked_get<std::string>(value_, "string"); }
const JsonValue::array& JsonValue::as_array() const { return checked_get<array>(value_, "array"); }
const JsonValue::object& JsonValue::as_object() const { return checked_get<object>(value_, "object"); }
JsonValue::array& JsonValue::as_array() { return checked_get<array>(value_, "array"); }
JsonValue::object& JsonValue::as_object() { return checked_get<object>(value_, "object"); }

const JsonValue* JsonValue::find(std::string_view key) const {
  const auto* obj = std::get_if<object>(&value_);
  if (obj == nullptr) {
    return nullptr;
  }
  const auto it = obj->find(key);
  return it == obj->end() ? nullptr : &it->second;
}

JsonValue* JsonValue::find(std::string_view key) {
  auto* obj = std::get_if<object>(&value_);
  if (obj == nullptr) {
    return nullptr;
  }
  const auto it = obj->find(key);
  return it == obj->end() ? nullptr : &it->second;
}

const JsonValue::storage& JsonValue::raw() const { return value_; }

namespace {

constexpr uint32_t kMaxNestingDepth = 128;

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_value(char c) {
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

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

class Reader {
public:
  explicit Reader(std::string_view text) : text_(text) {}

  JsonValue read_document() {
    skip_ws();
    auto value = read_value(0);
    skip_ws();
    if (pos_ != text_.size()) {
      throw fail("trailing characters after document");
    }
    return value;
  }

private:
  std::string_view text_;
  size_t pos_ = 0;

  [[nodiscard]] JsonError fail(const std::string& what) const {
    return JsonError(what + " at offset " + std::to_string(pos_));
  }

  char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  char take() {
    if (pos_ >= text_.size()) {
      throw fail("unexpected end of input");
    }
    return text_[pos_++];
  }

  void expect(char c) {
    if (take() != c) {
      --pos_;
      throw fail(std::string("expected '") + c + "'");
    }
  }

  void skip_ws() {
    while (pos_ < text_.size() && is_ws(text_[pos_])) {
      ++pos_;
    }
  }

  JsonValue read_value(uint32_t depth) {
    if (depth > kMaxNestingDepth) {
      throw fail("nesting too deep");
    }
    switch (peek()) {
      case 'n':
        read_keyword("null");
        return JsonValue(nullptr);
      case 't':
        read_keyword("true");
        return JsonValue(true);
      case 'f':
        read_keyword("false");
        return JsonValue(false);
      case '"':
        return JsonValue(read_string());
      case '[':
        return read_array(depth);
      case '{':
        return read_object(depth);
      default:
        if (peek() == '-' || is_digit(peek())) {
          return read_number();
        }
        throw fail("unexpected character");
    }
  }

  void read_keyword(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) {
      throw fail("invalid literal");
    }
    pos_ += word.size();
  }

  uint32_t read_hex4() {
    uint32_t out = 0;
    for (int i = 0; i < 4; ++i) {
      const int v = hex_value(take());
      if (v < 0) {
        throw fail("invalid \\u escape");
      }
      out = (out << 4U) | static_cast<uint32_t>(v);
    }
    return out;
  }

  std::string read_string() {
    expect('"');
    std::string out;
    while (true) {
      const char c = take();
      if (c == '"') {
        return out;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        throw fail("control character in string");
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char esc = take();
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          uint32_t cp = read_hex4();
          if (cp >= 0xD800U && cp <= 0xDBFFU) {
            if (take() != '\\' || take() != 'u') {
              throw fail("unpaired surrogate");
            }
            const uint32_t low = read_hex4();
            if (low < 0xDC00U || low > 0xDFFFU) {
              throw fail("invalid low surrogate");
            }
            cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
          } else if (cp >= 0xDC00U && cp <= 0xDFFFU) {
            throw fail("unpaired surrogate");
          }
          append_utf8(out, cp);
          break;
        }
        default:
          throw fail("invalid escape");
      }
    }
  }

  JsonValue read_number() {
    const size_t start = pos_;
    bool negative = false;
    bool fractional = false;

    if (peek() == '-') {
      negative = true;
      ++pos_;
    }
    if (peek() == '0') {
      ++pos_;
    } else if (is_digit(peek())) {
      while (is_digit(peek())) {
        ++pos_;
      }
    } else {
      throw fail("invalid number");
    }
    if (peek() == '.') {
      fractional = true;
      ++pos_;
      if (!is_digit(peek())) {
        throw fail("invalid number");
      }
      while (is_digit(peek())) {
        ++pos_;
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      fractional = true;
      ++pos_;
      if (peek() == '+' || peek() == '-') {
        ++pos_;
      }
      if (!is_digit(peek())) {
        throw fail("invalid number");
      }
      while (is_digit(peek())) {
        ++pos_;
      }
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (!fractional) {
      if (negative) {
        int64_t v = 0;
        if (std::from_chars(first, last, v).ec == std::errc()) {
          return JsonValue(v);
        }
      } else {
        uint64_t v = 0;
        if (std::from_chars(first, last, v).ec == std::errc()) {
          return JsonValue(v);
        }
      }
      // Integers outside 64 bits degrade to double.
    }
    double v = 0.0;
    if (std::from_chars(first, last, v).ec != std::errc()) {
      throw fail("number out of range");
    }
    return JsonValue(v);
  }

  JsonValue read_array(uint32_t depth) {
    expect('[');
    JsonValue::array out;
    skip_ws();
    if (peek() == ']') {
      ++pos_;
      return JsonValue(std::move(out));
    }
    while (true) {
      skip_ws();
      out.push_back(read_value(depth + 1));
      skip_ws();
      const char c = take();
      if (c == ']') {
        return JsonValue(std::move(out));
      }
      if (c != ',') {
        throw fail("expected ',' or ']'");
      }
    }
  }

  JsonValue read_object(uint32_t depth) {
    expect('{');
    JsonValue::object out;
    skip_ws();
    if (peek() == '}') {
      ++pos_;
      return JsonValue(std::move(out));
    }
    while (true) {
      skip_ws();
      std::string key = read_string();
      skip_ws();
      expect(':');
      skip_ws();
      out.insert_or_assign(std::move(key), read_value(depth + 1));
      skip_ws();
      const char c = take();
      if (c == '}') {
        return JsonValue(std::move(out));
      }
      if (c != ',') {
        throw fail("expected ',' or '}'");
      }
    }
  }
};

class Writer {
public:
  Writer(bool pretty, uint32_t indent) : pretty_(pretty), indent_(indent) {}

  std::string take() { return std::move(out_); }

  void write(const JsonValue& value, uint32_t level) {
    std::visit([&](const auto& v) { write_alternative(v, level); }, value.raw());
  }

private:
  std::string out_;
  bool pretty_;
  uint32_t indent_;

  void newline(uint32_t level) {
    if (pretty_) {
      out_.push_back('\n');
      out_.append(static_cast<size_t>(level) * indent_, ' ');
    }
  }

  void write_alternative(std::nullptr_t, uint32_t) { out_.append("null"); }
  void write_alternative(bool v, uint32_t) { out_.append(v ? "true" : "false"); }
  void write_alternative(int64_t v, uint32_t) { out_.append(std::to_string(v)); }
  void write_alternative(uint64_t v, uint32_t) { out_.append(std::to_string(v)); }

  void write_alternative(double v, uint32_t) {
    char buffer[32];
    const auto res = std::to_chars(buffer, buffer + sizeof(buffer), v);
    out_.append(buffer, res.ptr);
  }

  void write_alternative(const std::string& v, uint32_t) { write_quoted(v); }

  void write_alternative(const JsonValue::array& arr, uint32_t level) {
    out_.push_back('[');
    bool first = true;
    for (const auto& item : arr) {
      if (!first) {
        out_.push_back(',');
      }
      first = false;
      newline(level + 1);
      write(item, level + 1);
    }
    if (!arr.empty()) {
      newline(level);
    }
    out_.push_back(']');
  }

  void write_alternative(const JsonValue::object& obj, uint32_t level) {
    out_.push_back('{');
    bool first = true;
    for (const auto& [key, item] : obj) {
      if (!first) {
        out_.push_back(',');
      }
      first = false;
      newline(level + 1);
      write_quoted(key);
      out_.append(pretty_ ? ": " : ":");
      write(item, level + 1);
    }
    if (!obj.empty()) {
      newline(level);
    }
    out_.push_back('}');
  }

  void write_quoted(const std::string& s) {
    out_.push_back('"');
    for (const char c : s) {
      switch (c) {
        case '"': out_.append("\\\""); break;
        case '\\': out_.append("\\\\"); break;
        case '\n': out_.append("\\n"); break;
        case '\r': out_.append("\\r"); break;
        case '\t': out_.append("\\t"); break;
        case '\b': out_.append("\\b"); break;
        case '\f': out_.append("\\f"); break;
        default:
          if (static_cast<unsigned char>(c) < 0x20U) {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out_.append(buffer);
          } else {
            out_.push_back(c);
          }
          break;
      }
    }
    out_.push_back('"');
  }
};

} // namespace

JsonValue parse_json(std::string_view text) {
  Reader reader(text);
  return reader.read_document();
}

std::string to_json(const JsonValue& value, bool pretty, uint32_t indent) {
  Writer writer(pretty, indent);
  writer.write(value, 0);
  return writer.take();
}

std::optional<std::string> json_string_member(const JsonValue& obj, std::string_view key) {
  const auto* v = obj.find(key);
  if (v == nullptr || v->is_null()) {
    return std::nullopt;
  }
  if (!v->is_string()) {
    throw JsonError("field '" + std::string(key) + "' must be a string");
  }
  return v->as_string();
}

std::optional<uint64_t> json_uint_member(const JsonValue& obj, std::string_view key) {
  const auto* v = obj.find(key);
  if (v == nullptr || v->is_null()) {
    return std::nullopt;
  }
  if (!v->is_number()) {
    throw JsonError("field '" + std::string(key) + "' must be a number");
  }
  try {
    return v->as_uint64();
  } catch (const JsonError&) {
    throw JsonError("field '" + std::string(key) + "' must be non-negative");
  }
}

std::optional<bool> json_bool_member(const JsonValue& obj, std::string_view key) {
  const auto* v = obj.find(key);
  if (v == nullptr || v->is_null()) {
    return std::nullopt;
  }
  if (!v->is_bool()) {
    throw JsonError("field '" + std::string(key) + "' must be true or false");
  }
  return v->as_bool();
}

} // namespace rxminer
