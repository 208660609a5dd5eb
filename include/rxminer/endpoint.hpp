#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rxminer {

struct Endpoint {
  std::string scheme;
  std::string host;
  uint16_t port = 0;
  // Always starts with '/'; "/" when the URL has no path.
  std::string path = "/";
};

// Accepts scheme://host[:port][/path] and bare host:port. IPv6 hosts use
// brackets. Throws ConfigError on malformed input or a missing port with no
// default.
Endpoint parse_endpoint(std::string_view url, uint16_t default_port = 0);

std::string format_endpoint(const Endpoint& endpoint);

} // namespace rxminer
