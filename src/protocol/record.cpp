#include "protocol/record.hpp"

#include <limits>
#include <utility>

#include "ipc_error.hpp"

namespace ipc_protocol {

using neutral_ipc::ErrorCode;
using neutral_ipc::IpcError;

namespace {

// Header field offsets
constexpr size_t kOffReserved = 0;
constexpr size_t kOffControl = 1;
constexpr size_t kOffFormat1 = 2;
constexpr size_t kOffLength1 = 3;
constexpr size_t kOffFormat2 = 7;
constexpr size_t kOffLength2 = 8;

inline uint32_t decode_u32_be(const uint8_t b[4]) {
  return (static_cast<uint32_t>(b[0]) << 24) |
         (static_cast<uint32_t>(b[1]) << 16) |
         (static_cast<uint32_t>(b[2]) << 8) | (static_cast<uint32_t>(b[3]));
}

inline void encode_u32_be(uint32_t v, uint8_t b[4]) {
  b[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  b[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  b[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  b[3] = static_cast<uint8_t>(v & 0xFF);
}

uint32_t checked_length(const std::string &content, const char *name) {
  if (content.size() > std::numeric_limits<uint32_t>::max()) {
    throw IpcError(ErrorCode::InvalidRequest,
                   std::string(name) + " exceeds the uint32 length field (" +
                       std::to_string(content.size()) + " bytes)");
  }
  return static_cast<uint32_t>(content.size());
}

} // namespace

HeaderBytes encode_header(uint8_t control, uint8_t format1, uint32_t length1,
                          uint8_t format2, uint32_t length2) {
  HeaderBytes hdr{};
  hdr[kOffReserved] = kReserved;
  hdr[kOffControl] = control;
  hdr[kOffFormat1] = format1;
  encode_u32_be(length1, hdr.data() + kOffLength1);
  hdr[kOffFormat2] = format2;
  encode_u32_be(length2, hdr.data() + kOffLength2);
  return hdr;
}

Bytes encode_record(uint8_t control, uint8_t format1,
                    const std::string &content1, uint8_t format2,
                    const std::string &content2) {
  const uint32_t length1 = checked_length(content1, "content-1");
  const uint32_t length2 = checked_length(content2, "content-2");

  const HeaderBytes hdr =
      encode_header(control, format1, length1, format2, length2);

  Bytes record;
  record.reserve(kHeaderLen + content1.size() + content2.size());
  record.insert(record.end(), hdr.begin(), hdr.end());
  record.insert(record.end(), content1.begin(), content1.end());
  record.insert(record.end(), content2.begin(), content2.end());
  return record;
}

Header decode_header(const uint8_t *data, size_t len) {
  if (len != kHeaderLen) {
    throw IpcError(ErrorCode::InvalidHeaderLength,
                   "invalid header length: expected " +
                       std::to_string(kHeaderLen) + " bytes, got " +
                       std::to_string(len));
  }

  Header h;
  h.reserved = data[kOffReserved];
  h.control = data[kOffControl];
  h.format1 = data[kOffFormat1];
  h.length1 = decode_u32_be(data + kOffLength1);
  h.format2 = data[kOffFormat2];
  h.length2 = decode_u32_be(data + kOffLength2);
  return h;
}

Header decode_header(const Bytes &bytes) {
  return decode_header(bytes.data(), bytes.size());
}

Record decode_record(const uint8_t *header, size_t header_len,
                     std::string content1, std::string content2) {
  const Header h = decode_header(header, header_len);

  Record r;
  r.reserved = kReserved;
  r.control = h.control;
  r.format1 = h.format1;
  r.content1 = std::move(content1);
  r.format2 = h.format2;
  r.content2 = std::move(content2);
  return r;
}

} // namespace ipc_protocol
