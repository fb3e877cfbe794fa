#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config.hpp"
#include "protocol/record.hpp"
#include "transport/byte_stream.hpp"

namespace neutral_ipc {

constexpr std::chrono::milliseconds kProbeTimeout{1000};

// Request fields of one exchange. Content blocks are raw bytes.
struct Request {
  uint8_t control = 0;
  uint8_t format1 = 0;
  std::string content1;
  uint8_t format2 = 0;
  std::string content2;
};

// Writes the request, then reads the header and both content blocks from an
// already-connected stream, chunk_size bytes per read at most.
// Throws IpcError; never returns a partial record.
ipc_protocol::Record exchange(ipc_transport::ByteStream &stream,
                              const Request &request, size_t chunk_size);

// Sends the minimal parse request and reads only the reply header.
// Returns false on any failure.
bool probe(ipc_transport::ByteStream &stream);

// One connection per call, closed before returning.
class IpcClient {
public:
  explicit IpcClient(IpcConfig config);

  // Connect, set read/write timeouts, exchange.
  // Throws IpcError(Io) for connect and timeout failures, plus everything
  // the stream overload of exchange() throws.
  ipc_protocol::Record exchange(const Request &request) const;

  // Liveness check with a fixed short timeout; never throws.
  bool is_server_available() const;

  const IpcConfig &config() const { return config_; }

private:
  IpcConfig config_;
};

// Shorthand for IpcClient(config).is_server_available().
bool is_server_available(const IpcConfig &config);

} // namespace neutral_ipc
