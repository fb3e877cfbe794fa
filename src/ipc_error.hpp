#pragma once

#include <stdexcept>
#include <string>

namespace neutral_ipc {

enum class ErrorCode {
  Io,                  // connect, socket option, send/recv failure or timeout
  InvalidHeaderLength, // header bytes != kHeaderLen
  InvalidResponse,     // reply is missing something the caller needs
  ConnectionClosed,    // peer closed before a header/content block completed
  InvalidUtf8,         // content block is not valid UTF-8
  Json,                // template schema/result could not be (de)serialized
  InvalidRequest       // caller contract violation (oversized block, chunk 0)
};

const char *error_code_name(ErrorCode code);

// Every failure of the record codec and the exchange is thrown as IpcError.
class IpcError : public std::runtime_error {
public:
  IpcError(ErrorCode code, const std::string &message);

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace neutral_ipc
