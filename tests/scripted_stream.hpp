#pragma once

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "ipc_error.hpp"
#include "protocol/record.hpp"
#include "transport/byte_stream.hpp"

// In-memory ByteStream that hands out `incoming` in fragments of the given
// sizes (cycled), then reports end of stream.
class ScriptedStream : public ipc_transport::ByteStream {
public:
  explicit ScriptedStream(std::string incoming,
                          std::vector<size_t> fragments = {})
      : incoming_(std::move(incoming)), fragments_(std::move(fragments)) {}

  void write_all(const uint8_t *data, size_t len) override {
    ++write_calls;
    if (fail_writes) {
      throw neutral_ipc::IpcError(neutral_ipc::ErrorCode::Io,
                                  "scripted write failure");
    }
    written.append(reinterpret_cast<const char *>(data), len);
  }

  size_t read_some(uint8_t *buf, size_t len) override {
    ++read_calls;
    largest_request = std::max(largest_request, len);
    if (pos_ >= incoming_.size()) {
      return 0;
    }

    size_t n = std::min(len, incoming_.size() - pos_);
    if (!fragments_.empty()) {
      n = std::min(n, fragments_[next_fragment_++ % fragments_.size()]);
    }
    std::memcpy(buf, incoming_.data() + pos_, n);
    pos_ += n;
    return n;
  }

  size_t consumed() const { return pos_; }

  std::string written;
  size_t read_calls = 0;
  size_t write_calls = 0;
  size_t largest_request = 0;
  bool fail_writes = false;

private:
  std::string incoming_;
  std::vector<size_t> fragments_;
  size_t next_fragment_ = 0;
  size_t pos_ = 0;
};

inline std::string to_string(const ipc_protocol::Bytes &bytes) {
  return std::string(bytes.begin(), bytes.end());
}
