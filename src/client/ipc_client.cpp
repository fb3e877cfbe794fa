#include "client/ipc_client.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "ipc_error.hpp"
#include "transport/framed_stream.hpp"
#include "transport/tcp_stream.hpp"

namespace neutral_ipc {

using ipc_protocol::Record;

Record exchange(ipc_transport::ByteStream &stream, const Request &request,
                size_t chunk_size) {
  const ipc_protocol::Bytes encoded =
      ipc_protocol::encode_record(request.control, request.format1,
                                  request.content1, request.format2,
                                  request.content2);
  ipc_transport::write_record(stream, encoded);

  const ipc_protocol::HeaderBytes hdr = ipc_transport::read_header(stream);
  const ipc_protocol::Header response =
      ipc_protocol::decode_header(hdr.data(), hdr.size());

  std::string content1 =
      ipc_transport::read_content(stream, response.length1, chunk_size);
  std::string content2 =
      ipc_transport::read_content(stream, response.length2, chunk_size);

  return ipc_protocol::decode_record(hdr.data(), hdr.size(),
                                     std::move(content1), std::move(content2));
}

bool probe(ipc_transport::ByteStream &stream) {
  const ipc_protocol::Bytes minimal = ipc_protocol::encode_record(
      ipc_protocol::kCtrlParseTemplate, ipc_protocol::kContentJson, "{}",
      ipc_protocol::kContentText, "");
  try {
    ipc_transport::write_record(stream, minimal);
    (void)ipc_transport::read_header(stream);
  } catch (const IpcError &e) {
    std::cerr << "[IpcProbe] no reply header (" << error_code_name(e.code())
              << "): " << e.what() << "\n";
    return false;
  } catch (const std::exception &e) {
    std::cerr << "[IpcProbe] no reply header: " << e.what() << "\n";
    return false;
  }
  return true;
}

IpcClient::IpcClient(IpcConfig config) : config_(std::move(config)) {}

Record IpcClient::exchange(const Request &request) const {
  const auto timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout);

  ipc_transport::TcpStream stream(config_.host, config_.port, timeout);
  stream.set_timeouts(timeout, timeout);

  return neutral_ipc::exchange(stream, request, config_.buffer_size);
}

bool IpcClient::is_server_available() const {
  try {
    ipc_transport::TcpStream stream(config_.host, config_.port, kProbeTimeout);
    stream.set_timeouts(kProbeTimeout, kProbeTimeout);
    if (!probe(stream)) {
      std::cerr << "[IpcProbe] " << stream.peer()
                << " accepted the connection but did not answer\n";
      return false;
    }
    return true;
  } catch (const IpcError &e) {
    std::cerr << "[IpcProbe] server unavailable at " << config_.host << ":"
              << config_.port << " (" << error_code_name(e.code())
              << "): " << e.what() << "\n";
    return false;
  } catch (const std::exception &e) {
    std::cerr << "[IpcProbe] server unavailable at " << config_.host << ":"
              << config_.port << ": " << e.what() << "\n";
    return false;
  }
}

bool is_server_available(const IpcConfig &config) {
  return IpcClient(config).is_server_available();
}

} // namespace neutral_ipc
