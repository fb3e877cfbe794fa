// src/transport/framed_stream.cpp
#include "transport/framed_stream.hpp"

#include <algorithm>
#include <vector>

#include "ipc_error.hpp"
#include "protocol/utf8.hpp"

namespace ipc_transport {

using neutral_ipc::ErrorCode;
using neutral_ipc::IpcError;

void read_exact(ByteStream &in, uint8_t *buf, size_t n) {
  size_t got = 0;
  while (got < n) {
    const size_t r = in.read_some(buf + got, n - got);
    if (r == 0) {
      throw IpcError(ErrorCode::ConnectionClosed,
                     "connection closed after " + std::to_string(got) + " of " +
                         std::to_string(n) + " bytes");
    }
    got += r;
  }
}

ipc_protocol::HeaderBytes read_header(ByteStream &in) {
  ipc_protocol::HeaderBytes hdr{};
  read_exact(in, hdr.data(), hdr.size());
  return hdr;
}

std::string read_content(ByteStream &in, size_t length, size_t chunk_size) {
  if (length == 0) {
    return std::string();
  }
  if (chunk_size == 0) {
    throw IpcError(ErrorCode::InvalidRequest, "read chunk size must be > 0");
  }

  std::vector<uint8_t> chunk(std::min(chunk_size, length));
  std::string content;
  size_t remaining = length;

  while (remaining > 0) {
    const size_t want = std::min(chunk.size(), remaining);
    const size_t r = in.read_some(chunk.data(), want);
    if (r == 0) {
      throw IpcError(ErrorCode::ConnectionClosed,
                     "connection closed with " + std::to_string(remaining) +
                         " of " + std::to_string(length) +
                         " content bytes outstanding");
    }
    content.append(reinterpret_cast<const char *>(chunk.data()), r);
    remaining -= r;
  }

  if (!ipc_protocol::is_valid_utf8(content)) {
    throw IpcError(ErrorCode::InvalidUtf8,
                   "invalid UTF-8 encoding in response content");
  }
  return content;
}

void write_record(ByteStream &out, const ipc_protocol::Bytes &record) {
  out.write_all(record.data(), record.size());
}

} // namespace ipc_transport
