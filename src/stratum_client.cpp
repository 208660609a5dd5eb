#include "rxminer/stratum_client.hpp"

#include "rxminer/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <utility>
#include <variant>

namespace rxminer {

namespace {

constexpr uint32_t kLoginTimeoutMs = 10000;
constexpr const char* kReadTimeout = "timeout";

void set_error(std::string* error_message, std::string text) {
  if (error_message != nullptr) {
    *error_message = std::move(text);
  }
}

uint64_t read_le(const std::vector<uint8_t>& bytes) {
  uint64_t value = 0;
  for (size_t i = 0; i < bytes.size() && i < 8; ++i) {
    value |= static_cast<uint64_t>(bytes[i]) << (8U * i);
  }
  return value;
}

std::string upper_copy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

std::string json_error_text(const JsonValue& error) {
  if (error.is_string()) {
    return error.as_string();
  }
  if (error.is_object()) {
    if (const JsonValue* msg = error.find("message"); msg != nullptr && msg->is_string()) {
      return msg->as_string();
    }
  }
  return "pool returned error";
}

std::optional<uint64_t> parse_request_id(const JsonValue& value) {
  if (value.is_integer()) {
    if (const auto* v = std::get_if<int64_t>(&value.raw()); v != nullptr && *v < 0) {
      return std::nullopt;
    }
    return value.as_uint64();
  }
  if (value.is_string()) {
    const std::string& text = value.as_string();
    uint64_t id = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), id);
    if (res.ec == std::errc() && res.ptr == text.data() + text.size()) {
      return id;
    }
  }
  return std::nullopt;
}

} // namespace

bool parse_stratum_target(std::string_view hex, Target* out) {
  std::vector<uint8_t> bytes;
  if (!parse_hex(hex, &bytes)) {
    return false;
  }
  if (bytes.size() == 4) {
    const uint64_t compact = read_le(bytes);
    if (compact == 0) {
      return false;
    }
    *out = Target::from_compact(std::numeric_limits<uint64_t>::max() / (0xFFFFFFFFULL / compact));
    return true;
  }
  if (bytes.size() == 8) {
    const uint64_t compact = read_le(bytes);
    if (compact == 0) {
      return false;
    }
    *out = Target::from_compact(compact);
    return true;
  }
  if (bytes.size() == 32) {
    std::array<uint8_t, 32> be{};
    std::copy(bytes.begin(), bytes.end(), be.begin());
    *out = Target::from_be_bytes(be);
    return !out->is_zero();
  }
  return false;
}

bool parse_stratum_job(const JsonValue& value, StratumJob* out, std::string* error_message) {
  if (!value.is_object()) {
    set_error(error_message, "job is not an object");
    return false;
  }

  try {
    StratumJob job;
    const auto job_id = json_string_member(value, "job_id");
    const auto blob = json_string_member(value, "blob");
    if (!job_id || job_id->empty() || !blob) {
      set_error(error_message, "job is missing job_id or blob");
      return false;
    }
    job.job_id = *job_id;
    if (!parse_hex(*blob, &job.blob) || job.blob.empty()) {
      set_error(error_message, "job blob is not valid hex");
      return false;
    }

    if (const auto offset = json_uint_member(value, "nonce_offset")) {
      job.nonce_offset = static_cast<uint32_t>(std::min<uint64_t>(*offset, std::numeric_limits<uint32_t>::max()));
    }
    if (static_cast<uint64_t>(job.nonce_offset) + 4 > job.blob.size()) {
      set_error(error_message, "job blob is too short for its nonce");
      return false;
    }

    if (const auto target = json_string_member(value, "target")) {
      if (!parse_stratum_target(*target, &job.target)) {
        set_error(error_message, "job target '" + *target + "' is invalid");
        return false;
      }
    } else if (const JsonValue* diff = value.find("difficulty"); diff != nullptr && diff->is_number()) {
      const double d = diff->as_double();
      if (!(d >= 1.0)) {
        set_error(error_message, "job difficulty is invalid");
        return false;
      }
      job.target = Target::from_difficulty(static_cast<uint64_t>(d));
    } else {
      set_error(error_message, "job has no target");
      return false;
    }

    if (const auto seed = json_string_member(value, "seed_hash")) {
      if (!parse_hex(*seed, &job.seed)) {
        set_error(error_message, "job seed_hash is not valid hex");
        return false;
      }
    }
    if (const auto height = json_uint_member(value, "height")) {
      job.height = *height;
    }
    if (const auto algo = json_string_member(value, "algo")) {
      job.algorithm = parse_algorithm_kind(*algo);
      if (!job.algorithm) {
        set_error(error_message, "job uses unsupported algorithm '" + *algo + "'");
        return false;
      }
    }

    *out = std::move(job);
    return true;
  } catch (const JsonError& e) {
    set_error(error_message, e.what());
    return false;
  }
}

bool parse_stratum_message(const JsonValue& value, StratumMessage* out, std::string* error_message) {
  if (!value.is_object()) {
    set_error(error_message, "message is not an object");
    return false;
  }

  StratumMessage msg;
  if (const JsonValue* id = value.find("id"); id != nullptr) {
    msg.id = parse_request_id(*id);
  }

  if (const JsonValue* method = value.find("method"); method != nullptr && method->is_string()) {
    if (method->as_string() != "job") {
      msg.kind = StratumMessage::Kind::Other;
      *out = std::move(msg);
      return true;
    }
    const JsonValue* params = value.find("params");
    if (params == nullptr || !parse_stratum_job(*params, &msg.job, error_message)) {
      if (params == nullptr) {
        set_error(error_message, "job notification has no params");
      }
      return false;
    }
    msg.kind = StratumMessage::Kind::Job;
    *out = std::move(msg);
    return true;
  }

  if (!msg.id) {
    set_error(error_message, "message has neither method nor id");
    return false;
  }

  msg.kind = StratumMessage::Kind::Response;
  if (const JsonValue* error = value.find("error"); error != nullptr && !error->is_null()) {
    msg.ok = false;
    msg.error = json_error_text(*error);
  } else {
    msg.ok = true;
    if (const JsonValue* result = value.find("result"); result != nullptr) {
      msg.result = *result;
      if (result->is_bool()) {
        msg.ok = result->as_bool();
      } else if (const JsonValue* status = result->find("status"); status != nullptr && status->is_string()) {
        const std::string s = upper_copy(status->as_string());
        msg.ok = s == "OK" || s == "KEEPALIVED";
        if (!msg.ok) {
          msg.error = status->as_string();
        }
      }
    }
  }
  *out = std::move(msg);
  return true;
}

std::string format_submit_nonce(uint64_t nonce) {
  const uint32_t low = static_cast<uint32_t>(nonce);
  const std::array<uint8_t, 4> bytes{
    static_cast<uint8_t>(low & 0xFFU),
    static_cast<uint8_t>((low >> 8U) & 0xFFU),
    static_cast<uint8_t>((low >> 16U) & 0xFFU),
    static_cast<uint8_t>((low >> 24U) & 0xFFU),
  };
  return to_hex(bytes.data(), bytes.size());
}

StratumClient::StratumClient(Endpoint endpoint, std::string agent)
  : endpoint_(std::move(endpoint)), agent_(std::move(agent)) {}

void StratumClient::connect() {
  stream_.connect(endpoint_.host, endpoint_.port);
}

void StratumClient::disconnect() {
  stream_.close();
  session_id_.clear();
  pending_.clear();
}

void StratumClient::interrupt() {
  stream_.interrupt();
}

uint64_t StratumClient::send_request(const std::string& method, JsonValue params, std::string* error_message) {
  const uint64_t id = next_request_id_++;
  JsonValue::object request{
    {"id", JsonValue(id)},
    {"jsonrpc", JsonValue("2.0")},
    {"method", JsonValue(method)},
    {"params", std::move(params)},
  };
  std::string line = to_json(JsonValue(std::move(request)), false);
  line.push_back('\n');
  std::string write_error;
  if (!stream_.write_all(line, &write_error)) {
    set_error(error_message, method + " request failed: " + write_error);
    return 0;
  }
  return id;
}

bool StratumClient::read_message(StratumMessage* out, uint32_t timeout_ms, std::string* error_message) {
  std::string line;
  std::string read_error;
  if (!stream_.read_line(&line, timeout_ms, &read_error)) {
    set_error(error_message, read_error == kReadTimeout ? std::string() : "pool " + read_error);
    return false;
  }

  std::string parse_error;
  try {
    if (parse_stratum_message(parse_json(line), out, &parse_error)) {
      return true;
    }
  } catch (const JsonError& e) {
    parse_error = std::string("invalid JSON: ") + e.what();
  }
  log_warn("pool", "dropping message: " + parse_error);
  *out = StratumMessage{};
  return true;
}

bool StratumClient::login(
  const std::string& user,
  const std::string& pass,
  const std::string& rig_id,
  std::string* error_message) {
  session_id_.clear();
  pending_.clear();

  JsonValue::object params{
    {"login", JsonValue(user)},
    {"pass", JsonValue(pass)},
    {"agent", JsonValue(agent_)},
  };
  if (!rig_id.empty()) {
    params.emplace("rigid", JsonValue(rig_id));
  }
  const uint64_t id = send_request("login", JsonValue(std::move(params)), error_message);
  if (id == 0) {
    return false;
  }

  while (true) {
    StratumMessage msg;
    std::string read_error;
    if (!read_message(&msg, kLoginTimeoutMs, &read_error)) {
      set_error(error_message, read_error.empty() ? "timeout waiting for login response" : read_error);
      return false;
    }
    if (msg.kind != StratumMessage::Kind::Response || msg.id != id) {
      if (msg.kind == StratumMessage::Kind::Job) {
        pending_.push_back(std::move(msg));
      }
      continue;
    }
    if (!msg.ok) {
      set_error(error_message, "login rejected: " + msg.error);
      return false;
    }

    const auto session = json_string_member(msg.result, "id");
    if (!session || session->empty()) {
      set_error(error_message, "login response has no session id");
      return false;
    }
    session_id_ = *session;

    if (const JsonValue* job = msg.result.find("job"); job != nullptr && job->is_object()) {
      StratumMessage initial;
      std::string job_error;
      if (parse_stratum_job(*job, &initial.job, &job_error)) {
        initial.kind = StratumMessage::Kind::Job;
        pending_.push_front(std::move(initial));
      } else {
        log_warn("pool", "login job dropped: " + job_error);
      }
    }
    return true;
  }
}

uint64_t StratumClient::send_submit(
  const std::string& job_id,
  uint64_t nonce,
  const Digest& result,
  std::string* error_message) {
  return send_request(
    "submit",
    JsonValue(JsonValue::object{
      {"id", JsonValue(session_id_)},
      {"job_id", JsonValue(job_id)},
      {"nonce", JsonValue(format_submit_nonce(nonce))},
      {"result", JsonValue(to_hex(result))},
    }),
    error_message);
}

bool StratumClient::send_keepalive(std::string* error_message) {
  return send_request(
    "keepalived",
    JsonValue(JsonValue::object{{"id", JsonValue(session_id_)}}),
    error_message) != 0;
}

bool StratumClient::poll(StratumMessage* out, uint32_t timeout_ms, std::string* error_message) {
  if (!pending_.empty()) {
    *out = std::move(pending_.front());
    pending_.pop_front();
    return true;
  }
  set_error(error_message, std::string());
  return read_message(out, timeout_ms, error_message);
}

} // namespace rxminer
