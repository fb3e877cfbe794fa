#include "ipc_error.hpp"

namespace neutral_ipc {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Io:
    return "io";
  case ErrorCode::InvalidHeaderLength:
    return "invalid_header_length";
  case ErrorCode::InvalidResponse:
    return "invalid_response";
  case ErrorCode::ConnectionClosed:
    return "connection_closed";
  case ErrorCode::InvalidUtf8:
    return "invalid_utf8";
  case ErrorCode::Json:
    return "json";
  case ErrorCode::InvalidRequest:
    return "invalid_request";
  }
  return "unknown";
}

IpcError::IpcError(ErrorCode code, const std::string &message)
    : std::runtime_error(message), code_(code) {}

} // namespace neutral_ipc
