// src/transport/byte_stream.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace ipc_transport {

// Blocking, connection-oriented byte stream. Implementations throw
// neutral_ipc::IpcError(Io) on transport failures and timeouts.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  // Writes all len bytes or throws.
  virtual void write_all(const uint8_t *data, size_t len) = 0;

  // Reads at most len bytes into buf. Returns 0 only when the peer has
  // closed the stream.
  virtual size_t read_some(uint8_t *buf, size_t len) = 0;
};

} // namespace ipc_transport
