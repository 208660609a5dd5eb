#include "rxminer/node_client.hpp"

#include "rxminer/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace rxminer {

namespace {

constexpr uint32_t kHttpTimeoutMs = 30000;
constexpr size_t kMaxResponseBytes = 16U * 1024U * 1024U;

void set_error(std::string* error_message, std::string text) {
  if (error_message != nullptr) {
    *error_message = std::move(text);
  }
}

std::string lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

bool decode_chunked(std::string_view data, std::string* out, std::string* error_message) {
  out->clear();
  while (true) {
    const size_t eol = data.find("\r\n");
    if (eol == std::string_view::npos) {
      set_error(error_message, "truncated chunk header");
      return false;
    }
    std::string_view size_text = data.substr(0, eol);
    if (const size_t ext = size_text.find(';'); ext != std::string_view::npos) {
      size_text = size_text.substr(0, ext);
    }
    size_text = trim(size_text);
    size_t size = 0;
    const auto res = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
    if (size_text.empty() || res.ec != std::errc()) {
      set_error(error_message, "invalid chunk size");
      return false;
    }
    data.remove_prefix(eol + 2);
    if (size == 0) {
      return true;
    }
    if (data.size() < size + 2) {
      set_error(error_message, "truncated chunk");
      return false;
    }
    out->append(data.substr(0, size));
    data.remove_prefix(size + 2);
  }
}

const JsonValue& require(const JsonValue& obj, std::string_view key) {
  const JsonValue* value = obj.find(key);
  if (value == nullptr || value->is_null()) {
    throw ProtocolError("block template is missing '" + std::string(key) + "'");
  }
  return *value;
}

std::vector<uint8_t> require_hex(const JsonValue& obj, std::string_view key) {
  const JsonValue& value = require(obj, key);
  std::vector<uint8_t> out;
  if (!value.is_string() || !parse_hex(value.as_string(), &out)) {
    throw ProtocolError("block template field '" + std::string(key) + "' is not hex");
  }
  return out;
}

} // namespace

std::string base64_encode(std::string_view data) {
  static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    const uint32_t v = (static_cast<uint8_t>(data[i]) << 16U) |
                       (static_cast<uint8_t>(data[i + 1]) << 8U) |
                       static_cast<uint8_t>(data[i + 2]);
    out.push_back(kAlphabet[(v >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(v >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(v >> 6U) & 0x3FU]);
    out.push_back(kAlphabet[v & 0x3FU]);
  }
  const size_t rest = data.size() - i;
  if (rest > 0) {
    uint32_t v = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16U;
    if (rest == 2) {
      v |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8U;
    }
    out.push_back(kAlphabet[(v >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(v >> 12U) & 0x3FU]);
    out.push_back(rest == 2 ? kAlphabet[(v >> 6U) & 0x3FU] : '=');
    out.push_back('=');
  }
  return out;
}

std::string build_http_post(const Endpoint& endpoint, std::string_view body, const std::string& user, const std::string& password) {
  std::ostringstream out;
  out << "POST " << endpoint.path << " HTTP/1.1\r\n"
      << "Host: " << endpoint.host << ':' << endpoint.port << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Accept: application/json\r\n"
      << "Connection: close\r\n"
      << "Content-Length: " << body.size() << "\r\n";
  if (!user.empty() || !password.empty()) {
    out << "Authorization: Basic " << base64_encode(user + ":" + password) << "\r\n";
  }
  out << "\r\n" << body;
  return out.str();
}

bool parse_http_response(std::string_view raw, HttpResponse* out, std::string* error_message) {
  const size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string_view::npos) {
    set_error(error_message, "incomplete HTTP header");
    return false;
  }

  HttpResponse response;
  std::string_view head = raw.substr(0, header_end);
  std::string_view body = raw.substr(header_end + 4);

  const size_t status_end = head.find("\r\n");
  std::string_view status_line = head.substr(0, status_end);
  head = status_end == std::string_view::npos ? std::string_view() : head.substr(status_end + 2);

  if (status_line.substr(0, 5) != "HTTP/") {
    set_error(error_message, "not an HTTP response");
    return false;
  }
  const size_t sp = status_line.find(' ');
  if (sp == std::string_view::npos || status_line.size() < sp + 4) {
    set_error(error_message, "malformed HTTP status line");
    return false;
  }
  std::string_view code = status_line.substr(sp + 1, 3);
  const auto res = std::from_chars(code.data(), code.data() + code.size(), response.status);
  if (res.ec != std::errc() || res.ptr != code.data() + code.size()) {
    set_error(error_message, "malformed HTTP status code");
    return false;
  }
  if (status_line.size() > sp + 5) {
    response.reason = std::string(trim(status_line.substr(sp + 5)));
  }

  while (!head.empty()) {
    const size_t eol = head.find("\r\n");
    std::string_view line = head.substr(0, eol);
    head = eol == std::string_view::npos ? std::string_view() : head.substr(eol + 2);
    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    response.headers[lower_copy(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
  }

  if (const auto te = response.headers.find("transfer-encoding");
      te != response.headers.end() && lower_copy(te->second).find("chunked") != std::string::npos) {
    if (!decode_chunked(body, &response.body, error_message)) {
      return false;
    }
  } else if (const auto cl = response.headers.find("content-length"); cl != response.headers.end()) {
    size_t length = 0;
    const auto r = std::from_chars(cl->second.data(), cl->second.data() + cl->second.size(), length);
    if (r.ec != std::errc()) {
      set_error(error_message, "invalid Content-Length");
      return false;
    }
    if (body.size() < length) {
      set_error(error_message, "truncated HTTP body");
      return false;
    }
    response.body = std::string(body.substr(0, length));
  } else {
    response.body = std::string(body);
  }

  *out = std::move(response);
  return true;
}

BlockTemplate parse_block_template(const JsonValue& result) {
  if (!result.is_object()) {
    throw ProtocolError("block template result is not an object");
  }
  try {
    BlockTemplate tpl;
    tpl.template_blob = require_hex(result, "blocktemplate_blob");
    if (result.find("blockhashing_blob") != nullptr) {
      tpl.hashing_blob = require_hex(result, "blockhashing_blob");
    } else {
      tpl.hashing_blob = tpl.template_blob;
    }
    tpl.difficulty = require(result, "difficulty").as_uint64();
    tpl.height = require(result, "height").as_uint64();
    if (result.find("seed_hash") != nullptr) {
      tpl.seed = require_hex(result, "seed_hash");
    }
    if (const auto prev = json_string_member(result, "prev_hash")) {
      tpl.prev_hash = *prev;
    }
    if (tpl.difficulty == 0) {
      throw ProtocolError("block template difficulty is zero");
    }
    if (tpl.hashing_blob.size() < tpl.nonce_offset + 4U || tpl.template_blob.size() < tpl.nonce_offset + 4U) {
      throw ProtocolError("block template blob is too short");
    }
    return tpl;
  } catch (const JsonError& e) {
    throw ProtocolError(std::string("block template: ") + e.what());
  }
}

NodeClient::NodeClient(Endpoint endpoint, std::string user, std::string password)
  : endpoint_(std::move(endpoint)), user_(std::move(user)), password_(std::move(password)) {
  if (endpoint_.path == "/") {
    endpoint_.path = "/json_rpc";
  }
}

void NodeClient::interrupt() {
  stream_.interrupt();
}

JsonValue NodeClient::call(const std::string& method, JsonValue params) {
  std::lock_guard<std::mutex> lock(io_mutex_);

  JsonValue::object request{
    {"jsonrpc", JsonValue("2.0")},
    {"id", JsonValue(std::to_string(next_id_++))},
    {"method", JsonValue(method)},
    {"params", std::move(params)},
  };
  const std::string payload = build_http_post(endpoint_, to_json(JsonValue(std::move(request)), false), user_, password_);

  stream_.connect(endpoint_.host, endpoint_.port);
  std::string raw;
  std::string error;
  const bool ok = stream_.write_all(payload, &error) && stream_.read_to_end(&raw, kHttpTimeoutMs, kMaxResponseBytes, &error);
  stream_.close();
  if (!ok) {
    throw ConnectionError(method + ": " + error);
  }

  HttpResponse response;
  if (!parse_http_response(raw, &response, &error)) {
    throw ProtocolError(method + ": " + error);
  }
  if (response.status == 401) {
    throw ProtocolError(method + ": node rejected the RPC credentials");
  }
  if (response.status != 200) {
    throw ProtocolError(method + ": HTTP " + std::to_string(response.status) + " " + response.reason);
  }

  JsonValue reply;
  try {
    reply = parse_json(response.body);
  } catch (const JsonError& e) {
    throw ProtocolError(method + ": invalid JSON: " + e.what());
  }
  if (const JsonValue* err = reply.find("error"); err != nullptr && !err->is_null()) {
    std::string text = "RPC error";
    if (const JsonValue* msg = err->find("message"); msg != nullptr && msg->is_string()) {
      text = msg->as_string();
    }
    throw ProtocolError(method + ": " + text);
  }
  const JsonValue* result = reply.find("result");
  if (result == nullptr) {
    throw ProtocolError(method + ": response has no result");
  }
  return *result;
}

BlockTemplate NodeClient::get_block_template(const std::string& wallet_address, uint32_t reserve_size) {
  return parse_block_template(call(
    "get_block_template",
    JsonValue(JsonValue::object{
      {"wallet_address", JsonValue(wallet_address)},
      {"reserve_size", JsonValue(reserve_size)},
    })));
}

uint64_t NodeClient::height() {
  const JsonValue result = call("get_info", JsonValue(JsonValue::object{}));
  try {
    const auto value = json_uint_member(result, "height");
    if (!value) {
      throw ProtocolError("get_info: response has no height");
    }
    return *value;
  } catch (const JsonError& e) {
    throw ProtocolError(std::string("get_info: ") + e.what());
  }
}

bool NodeClient::submit_block(const std::vector<uint8_t>& block_blob, std::string* status) {
  const JsonValue result = call("submit_block", JsonValue(JsonValue::array{JsonValue(to_hex(block_blob))}));
  std::string text;
  if (const JsonValue* s = result.find("status"); s != nullptr && s->is_string()) {
    text = s->as_string();
  }
  if (status != nullptr) {
    *status = text;
  }
  return text == "OK";
}

} // namespace rxminer
