#include "rxminer/net.hpp"

#include <array>

namespace rxminer {

namespace {

void set_error(std::string* error_message, std::string text) {
  if (error_message != nullptr) {
    *error_message = std::move(text);
  }
}

} // namespace

TcpStream::~TcpStream() {
  close();
}

void TcpStream::connect(const std::string& host, uint16_t port) {
  close();
  initialize_network_stack_once();
  const SocketHandle sock = connect_tcp_socket(host, port);
  std::lock_guard<std::mutex> lock(handle_mutex_);
  handle_ = sock;
}

void TcpStream::close() {
  std::lock_guard<std::mutex> lock(handle_mutex_);
  close_socket_handle(handle_);
  handle_ = invalid_socket_handle();
  rx_buffer_.clear();
}

void TcpStream::interrupt() {
  std::lock_guard<std::mutex> lock(handle_mutex_);
  interrupt_socket_handle(handle_);
}

bool TcpStream::is_open() const {
  std::lock_guard<std::mutex> lock(handle_mutex_);
  return handle_ != invalid_socket_handle();
}

bool TcpStream::write_all(std::string_view data, std::string* error_message) {
  if (!is_open()) {
    set_error(error_message, "not connected");
    return false;
  }
  size_t written = 0;
  while (written < data.size()) {
    const size_t n = send_socket_data(
      handle_,
      reinterpret_cast<const uint8_t*>(data.data() + written),
      data.size() - written);
    if (n == 0) {
      set_error(error_message, "failed to send");
      return false;
    }
    written += n;
  }
  return true;
}

bool TcpStream::fill(uint32_t timeout_ms, std::string* error_message) {
  if (!is_open()) {
    set_error(error_message, "not connected");
    return false;
  }
  if (!wait_socket_readable(handle_, timeout_ms)) {
    set_error(error_message, "timeout");
    return false;
  }
  std::array<uint8_t, 4096> chunk{};
  const size_t n = recv_socket_data(handle_, chunk.data(), chunk.size());
  if (n == 0) {
    set_error(error_message, "connection closed");
    return false;
  }
  rx_buffer_.append(reinterpret_cast<const char*>(chunk.data()), n);
  return true;
}

bool TcpStream::read_line(std::string* out, uint32_t timeout_ms, std::string* error_message) {
  while (true) {
    const size_t nl = rx_buffer_.find('\n');
    if (nl != std::string::npos) {
      std::string line = rx_buffer_.substr(0, nl);
      rx_buffer_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.find_first_not_of(" \t") == std::string::npos) {
        continue;
      }
      *out = std::move(line);
      return true;
    }
    if (!fill(timeout_ms, error_message)) {
      return false;
    }
  }
}

bool TcpStream::read_to_end(std::string* out, uint32_t timeout_ms, size_t max_bytes, std::string* error_message) {
  while (true) {
    if (rx_buffer_.size() > max_bytes) {
      set_error(error_message, "response too large");
      return false;
    }
    std::string fill_error;
    if (!fill(timeout_ms, &fill_error)) {
      if (fill_error == "connection closed") {
        *out = std::move(rx_buffer_);
        rx_buffer_.clear();
        return true;
      }
      set_error(error_message, std::move(fill_error));
      return false;
    }
  }
}

} // namespace rxminer
