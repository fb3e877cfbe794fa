// src/transport/tcp_stream.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "transport/byte_stream.hpp"

namespace ipc_transport {

// One connected TCP socket. The socket is closed when the object goes out of
// scope; there is no reuse across exchanges.
class TcpStream : public ByteStream {
public:
  // Resolves host and connects, giving up after connect_timeout. The timeout
  // covers every resolved address together, not each one.
  // Throws IpcError(Io) on resolve/connect failure.
  TcpStream(const std::string &host, uint16_t port,
            std::chrono::milliseconds connect_timeout);
  ~TcpStream() override;

  TcpStream(const TcpStream &) = delete;
  TcpStream &operator=(const TcpStream &) = delete;

  // SO_RCVTIMEO / SO_SNDTIMEO. A blocked read or write that exceeds its
  // timeout throws IpcError(Io).
  void set_timeouts(std::chrono::milliseconds read_timeout,
                    std::chrono::milliseconds write_timeout);

  void write_all(const uint8_t *data, size_t len) override;
  size_t read_some(uint8_t *buf, size_t len) override;

  // "host:port" as given to the constructor.
  const std::string &peer() const { return peer_; }

private:
  void close();

  int fd_ = -1;
  std::string peer_;
};

} // namespace ipc_transport
