#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "protocol/constants.hpp"

namespace ipc_protocol {

using Bytes = std::vector<uint8_t>;
using HeaderBytes = std::array<uint8_t, kHeaderLen>;

// Decoded 12-byte record header.
struct Header {
  uint8_t reserved = kReserved;
  uint8_t control = 0;
  uint8_t format1 = 0;
  uint32_t length1 = 0;
  uint8_t format2 = 0;
  uint32_t length2 = 0;
};

// One complete message. Content blocks are held as raw bytes in std::string;
// decoded records only ever carry valid UTF-8.
struct Record {
  uint8_t reserved = kReserved;
  uint8_t control = 0;
  uint8_t format1 = 0;
  std::string content1;
  uint8_t format2 = 0;
  std::string content2;
};

HeaderBytes encode_header(uint8_t control, uint8_t format1, uint32_t length1,
                          uint8_t format2, uint32_t length2);

// Header followed by content1 and content2 verbatim, no delimiters.
// Throws IpcError(InvalidRequest) if a block does not fit a uint32 length.
Bytes encode_record(uint8_t control, uint8_t format1,
                    const std::string &content1, uint8_t format2,
                    const std::string &content2);

// Throws IpcError(InvalidHeaderLength) unless len == kHeaderLen.
Header decode_header(const uint8_t *data, size_t len);
Header decode_header(const Bytes &bytes);

// Validates the header again and packages the record. The returned reserved
// byte is kReserved regardless of what was on the wire.
Record decode_record(const uint8_t *header, size_t header_len,
                     std::string content1, std::string content2);

} // namespace ipc_protocol
