#include "rxminer/net_platform.hpp"

#include "rxminer/errors.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rxminer {

SocketHandle invalid_socket_handle() {
  return static_cast<SocketHandle>(-1);
}

void initialize_network_stack_once() {
}

SocketHandle connect_tcp_socket(const std::string& host, uint16_t port) {
  const std::string port_str = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  if (const int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result); rc != 0) {
    throw ConnectionError("failed to resolve " + host + ": " + gai_strerror(rc));
  }

  int sock = -1;
  int last_errno = 0;
  for (auto* ptr = result; ptr != nullptr; ptr = ptr->ai_next) {
    sock = socket(ptr->ai_family, ptr->ai_socktype | SOCK_CLOEXEC, ptr->ai_protocol);
    if (sock < 0) {
      last_errno = errno;
      continue;
    }

    const socklen_t addr_len = static_cast<socklen_t>(ptr->ai_addrlen);
    if (::connect(sock, ptr->ai_addr, addr_len) == 0) {
      break;
    }

    last_errno = errno;
    close(sock);
    sock = -1;
  }

  freeaddrinfo(result);

  if (sock < 0) {
    throw ConnectionError(
      "failed to connect to " + host + ":" + port_str + (last_errno != 0 ? std::string(": ") + std::strerror(last_errno) : ""));
  }

  const int one = 1;
  (void)setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  (void)setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
  return static_cast<SocketHandle>(sock);
}

void interrupt_socket_handle(SocketHandle sock) {
  if (sock == invalid_socket_handle()) {
    return;
  }
  (void)shutdown(static_cast<int>(sock), SHUT_RDWR);
}

void close_socket_handle(SocketHandle sock) {
  if (sock == invalid_socket_handle()) {
    return;
  }
  (void)close(static_cast<int>(sock));
}

size_t send_socket_data(SocketHandle sock, const uint8_t* data, size_t len) {
  ssize_t n = 0;
  do {
    n = send(static_cast<int>(sock), data, len, MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);
  if (n <= 0) {
    return 0;
  }
  return static_cast<size_t>(n);
}

size_t recv_socket_data(SocketHandle sock, uint8_t* data, size_t len) {
  ssize_t n = 0;
  do {
    n = recv(static_cast<int>(sock), data, len, 0);
  } while (n < 0 && errno == EINTR);
  if (n <= 0) {
    return 0;
  }
  return static_cast<size_t>(n);
}

bool wait_socket_readable(SocketHandle sock, uint32_t timeout_ms) {
  if (sock == invalid_socket_handle()) {
    return false;
  }
  pollfd pfd{};
  pfd.fd = static_cast<int>(sock);
  pfd.events = POLLIN;
  int rc = 0;
  do {
    rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
  } while (rc < 0 && errno == EINTR);
  // A hangup or error is reported as readable so the following recv sees it.
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

} // namespace rxminer
