#pragma once

#include "rxminer/endpoint.hpp"
#include "rxminer/json.hpp"
#include "rxminer/net.hpp"
#include "rxminer/types.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rxminer {

struct StratumJob {
  std::string job_id;
  std::vector<uint8_t> blob;
  uint32_t nonce_offset = 39;
  Target target;
  std::vector<uint8_t> seed;
  uint64_t height = 0;
  std::optional<AlgorithmKind> algorithm;
};

struct StratumMessage {
  enum class Kind {
    Job,
    Response,
    Other,
  };

  Kind kind = Kind::Other;
  std::optional<uint64_t> id;
  StratumJob job;
  // Response fields.
  bool ok = false;
  std::string error;
  JsonValue result;
};

// Pool target field: 4- or 8-byte little-endian compact values, or a full
// 32-byte big-endian target.
bool parse_stratum_target(std::string_view hex, Target* out);
bool parse_stratum_job(const JsonValue& value, StratumJob* out, std::string* error_message);
bool parse_stratum_message(const JsonValue& value, StratumMessage* out, std::string* error_message);
// Low 32 bits of the nonce as little-endian bytes, hex encoded.
std::string format_submit_nonce(uint64_t nonce);

// Monero stratum over newline-delimited JSON. Not thread-safe: one I/O thread
// owns the client and interrupt() is the only call allowed from elsewhere.
class StratumClient {
public:
  StratumClient(Endpoint endpoint, std::string agent);

  StratumClient(const StratumClient&) = delete;
  StratumClient& operator=(const StratumClient&) = delete;

  void connect();
  void disconnect();
  void interrupt();
  bool connected() const { return stream_.is_open(); }

  // On success the initial job, when the pool sends one, is available from poll().
  bool login(const std::string& user, const std::string& pass, const std::string& rig_id, std::string* error_message);
  // Returns the request id, or 0 when the request could not be sent.
  uint64_t send_submit(const std::string& job_id, uint64_t nonce, const Digest& result, std::string* error_message);
  bool send_keepalive(std::string* error_message);
  // Waits up to timeout_ms for the next message. False with an empty error
  // means the wait timed out.
  bool poll(StratumMessage* out, uint32_t timeout_ms, std::string* error_message);

  const std::string& session_id() const { return session_id_; }

private:
  uint64_t send_request(const std::string& method, JsonValue params, std::string* error_message);
  bool read_message(StratumMessage* out, uint32_t timeout_ms, std::string* error_message);

  Endpoint endpoint_;
  std::string agent_;
  TcpStream stream_;
  uint64_t next_request_id_ = 1;
  std::string session_id_;
  std::deque<StratumMessage> pending_;
};

} // namespace rxminer
