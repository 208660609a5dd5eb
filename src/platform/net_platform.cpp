#include "rxminer/net_platform.hpp"

#include "rxminer/errors.hpp"

namespace rxminer {

SocketHandle invalid_socket_handle() {
  return static_cast<SocketHandle>(-1);
}

void initialize_network_stack_once() {
}

SocketHandle connect_tcp_socket(const std::string& host, uint16_t) {
  throw ConnectionError("network stack is unavailable on this platform build (" + host + ")");
}

void interrupt_socket_handle(SocketHandle) {
}

void close_socket_handle(SocketHandle) {
}

size_t send_socket_data(SocketHandle, const uint8_t*, size_t) {
  return 0;
}

size_t recv_socket_data(SocketHandle, uint8_t*, size_t) {
  return 0;
}

bool wait_socket_readable(SocketHandle, uint32_t) {
  return false;
}

} // namespace rxminer
