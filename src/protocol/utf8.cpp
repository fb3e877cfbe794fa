#include "protocol/utf8.hpp"

namespace ipc_protocol {

static inline bool is_continuation(uint8_t b) { return (b & 0xC0) == 0x80; }

bool is_valid_utf8(const uint8_t *data, size_t len) {
  size_t i = 0;
  while (i < len) {
    const uint8_t b0 = data[i];

    if (b0 <= 0x7F) {
      ++i;
      continue;
    }

    size_t need = 0;
    // Bounds for the second byte; they exclude overlong encodings,
    // surrogates and values past U+10FFFF.
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
      need = 1;
    } else if (b0 == 0xE0) {
      need = 2;
      lo = 0xA0;
    } else if (b0 == 0xED) {
      need = 2;
      hi = 0x9F;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
      need = 2;
    } else if (b0 == 0xF0) {
      need = 3;
      lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
      need = 3;
    } else if (b0 == 0xF4) {
      need = 3;
      hi = 0x8F;
    } else {
      // 0x80..0xC1 and 0xF5..0xFF never start a sequence
      return false;
    }

    if (len - i <= need) {
      return false;
    }

    const uint8_t b1 = data[i + 1];
    if (b1 < lo || b1 > hi) {
      return false;
    }
    for (size_t k = 2; k <= need; ++k) {
      if (!is_continuation(data[i + k])) {
        return false;
      }
    }

    i += need + 1;
  }
  return true;
}

} // namespace ipc_protocol
