#pragma once

#include "rxminer/endpoint.hpp"
#include "rxminer/json.hpp"
#include "rxminer/net.hpp"
#include "rxminer/types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rxminer {

struct HttpResponse {
  int status = 0;
  std::string reason;
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;
};

std::string base64_encode(std::string_view data);
std::string build_http_post(const Endpoint& endpoint, std::string_view body, const std::string& user, const std::string& password);
// Handles Content-Length, chunked and read-until-close bodies.
bool parse_http_response(std::string_view raw, HttpResponse* out, std::string* error_message);

struct BlockTemplate {
  std::vector<uint8_t> template_blob;
  std::vector<uint8_t> hashing_blob;
  uint64_t difficulty = 0;
  uint64_t height = 0;
  std::vector<uint8_t> seed;
  std::string prev_hash;
  uint32_t nonce_offset = 39;
};

// Throws ProtocolError when a field is missing or malformed.
BlockTemplate parse_block_template(const JsonValue& result);

// monerod JSON-RPC over HTTP/1.1. One request per connection; calls are
// serialized. Transport failures throw ConnectionError, RPC failures
// ProtocolError.
class NodeClient {
public:
  NodeClient(Endpoint endpoint, std::string user, std::string password);

  NodeClient(const NodeClient&) = delete;
  NodeClient& operator=(const NodeClient&) = delete;

  BlockTemplate get_block_template(const std::string& wallet_address, uint32_t reserve_size = 8);
  uint64_t height();
  bool submit_block(const std::vector<uint8_t>& block_blob, std::string* status);

  // Wakes a call blocked on the network.
  void interrupt();

private:
  JsonValue call(const std::string& method, JsonValue params);

  Endpoint endpoint_;
  std::string user_;
  std::string password_;
  std::mutex io_mutex_;
  TcpStream stream_;
  uint64_t next_id_ = 1;
};

} // namespace rxminer
