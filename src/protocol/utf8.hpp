#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ipc_protocol {

// Strict UTF-8 check: rejects overlong forms, surrogates (U+D800..U+DFFF),
// code points above U+10FFFF and truncated sequences.
bool is_valid_utf8(const uint8_t *data, size_t len);

inline bool is_valid_utf8(const std::string &s) {
  return is_valid_utf8(reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

} // namespace ipc_protocol
