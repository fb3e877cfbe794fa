// src/transport/framed_stream.hpp
#pragma once

#include <cstdint>
#include <string>

#include "protocol/record.hpp"
#include "transport/byte_stream.hpp"

namespace ipc_transport {

// Reads exactly n bytes into buf.
// Throws IpcError(ConnectionClosed) if the stream ends before n bytes.
void read_exact(ByteStream &in, uint8_t *buf, size_t n);

// Reads one 12-byte record header.
ipc_protocol::HeaderBytes read_header(ByteStream &in);

// Reads one content block of exactly `length` bytes, at most `chunk_size`
// bytes per read call. A zero length returns "" without touching the stream.
// Throws:
//  - IpcError(ConnectionClosed) if the stream ends early
//  - IpcError(InvalidUtf8) if the block is not valid UTF-8
//  - IpcError(InvalidRequest) if chunk_size is 0
std::string read_content(ByteStream &in, size_t length, size_t chunk_size);

// Writes one encoded record in a single write_all call.
void write_record(ByteStream &out, const ipc_protocol::Bytes &record);

} // namespace ipc_transport
