#pragma once

#include "rxminer/net_platform.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace rxminer {

// Blocking TCP connection owned by one I/O thread. interrupt() may be called
// from any thread to wake a blocked read.
class TcpStream {
public:
  TcpStream() = default;
  ~TcpStream();

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  // Throws ConnectionError.
  void connect(const std::string& host, uint16_t port);
  void close();
  void interrupt();
  bool is_open() const;

  bool write_all(std::string_view data, std::string* error_message);
  // Returns one line without its terminator. Blank lines are skipped.
  bool read_line(std::string* out, uint32_t timeout_ms, std::string* error_message);
  // Reads until the peer closes the connection.
  bool read_to_end(std::string* out, uint32_t timeout_ms, size_t max_bytes, std::string* error_message);

private:
  bool fill(uint32_t timeout_ms, std::string* error_message);

  mutable std::mutex handle_mutex_;
  SocketHandle handle_ = invalid_socket_handle();
  std::string rx_buffer_;
};

} // namespace rxminer
