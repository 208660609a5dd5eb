#include "rxminer/endpoint.hpp"

#include "rxminer/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rxminer {

namespace {

std::string lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

uint16_t parse_port(std::string_view text, std::string_view url) {
  unsigned value = 0;
  const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || res.ec != std::errc() || res.ptr != text.data() + text.size() || value == 0 || value > 65535) {
    throw ConfigError("invalid port in '" + std::string(url) + "'");
  }
  return static_cast<uint16_t>(value);
}

} // namespace

Endpoint parse_endpoint(std::string_view url, uint16_t default_port) {
  Endpoint endpoint;
  std::string_view rest = url;

  if (const size_t sep = rest.find("://"); sep != std::string_view::npos) {
    endpoint.scheme = lower_copy(rest.substr(0, sep));
    rest.remove_prefix(sep + 3);
  }

  std::string_view authority = rest;
  if (const size_t slash = rest.find('/'); slash != std::string_view::npos) {
    authority = rest.substr(0, slash);
    endpoint.path = std::string(rest.substr(slash));
  }
  if (const size_t at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    const size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      throw ConfigError("unterminated IPv6 address in '" + std::string(url) + "'");
    }
    endpoint.host = std::string(authority.substr(1, close - 1));
    std::string_view tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        throw ConfigError("unexpected text after host in '" + std::string(url) + "'");
      }
      port_text = tail.substr(1);
    }
  } else if (const size_t colon = authority.rfind(':'); colon != std::string_view::npos) {
    endpoint.host = std::string(authority.substr(0, colon));
    port_text = authority.substr(colon + 1);
  } else {
    endpoint.host = std::string(authority);
  }

  if (endpoint.host.empty()) {
    throw ConfigError("missing host in '" + std::string(url) + "'");
  }
  if (!port_text.empty()) {
    endpoint.port = parse_port(port_text, url);
  } else if (default_port != 0) {
    endpoint.port = default_port;
  } else {
    throw ConfigError("missing port in '" + std::string(url) + "'");
  }
  return endpoint;
}

std::string format_endpoint(const Endpoint& endpoint) {
  std::string out;
  if (!endpoint.scheme.empty()) {
    out += endpoint.scheme + "://";
  }
  const bool ipv6 = endpoint.host.find(':') != std::string::npos;
  out += ipv6 ? "[" + endpoint.host + "]" : endpoint.host;
  out += ":" + std::to_string(endpoint.port);
  if (endpoint.path != "/") {
    out += endpoint.path;
  }
  return out;
}

} // namespace rxminer
