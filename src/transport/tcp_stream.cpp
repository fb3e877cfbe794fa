// src/transport/tcp_stream.cpp
#include "transport/tcp_stream.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "ipc_error.hpp"

namespace ipc_transport {

using neutral_ipc::ErrorCode;
using neutral_ipc::IpcError;

namespace {

std::string errno_text(int err) { return std::strerror(err); }

bool set_nonblocking(int fd, bool on) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return fcntl(fd, F_SETFL, updated) == 0;
}

// Non-blocking connect bounded by timeout. Returns 0 or an errno value.
int connect_with_timeout(int fd, const sockaddr *addr, socklen_t addr_len,
                         std::chrono::milliseconds timeout) {
  if (!set_nonblocking(fd, true)) {
    return errno;
  }

  if (::connect(fd, addr, addr_len) < 0) {
    if (errno != EINPROGRESS) {
      return errno;
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    int rc;
    do {
      rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
      return errno;
    }
    if (rc == 0) {
      return ETIMEDOUT;
    }

    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
      return errno;
    }
    if (so_error != 0) {
      return so_error;
    }
  }

  if (!set_nonblocking(fd, false)) {
    return errno;
  }
  return 0;
}

timeval to_timeval(std::chrono::milliseconds ms) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
  return tv;
}

} // namespace

TcpStream::TcpStream(const std::string &host, uint16_t port,
                     std::chrono::milliseconds connect_timeout)
    : peer_(host + ":" + std::to_string(port)) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const int gai =
      getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
  if (gai != 0) {
    throw IpcError(ErrorCode::Io, "failed to resolve " + peer_ + ": " +
                                      gai_strerror(gai));
  }

  // One budget for the whole address list.
  const auto deadline = std::chrono::steady_clock::now() + connect_timeout;

  int last_err = ECONNREFUSED;
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      last_err = ETIMEDOUT;
      break;
    }

    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd < 0) {
      last_err = errno;
      continue;
    }

    last_err = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen,
                                    remaining);
    if (last_err == 0) {
      fd_ = fd;
      break;
    }
    ::close(fd);
  }
  freeaddrinfo(res);

  if (fd_ < 0) {
    if (last_err == ETIMEDOUT) {
      throw IpcError(ErrorCode::Io, "connect to " + peer_ + " timed out");
    }
    throw IpcError(ErrorCode::Io,
                   "connect to " + peer_ + " failed: " + errno_text(last_err));
  }
}

TcpStream::~TcpStream() { close(); }

void TcpStream::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void TcpStream::set_timeouts(std::chrono::milliseconds read_timeout,
                             std::chrono::milliseconds write_timeout) {
  const timeval rtv = to_timeval(read_timeout);
  if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv)) < 0) {
    throw IpcError(ErrorCode::Io,
                   "setsockopt(SO_RCVTIMEO) failed: " + errno_text(errno));
  }

  const timeval wtv = to_timeval(write_timeout);
  if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &wtv, sizeof(wtv)) < 0) {
    throw IpcError(ErrorCode::Io,
                   "setsockopt(SO_SNDTIMEO) failed: " + errno_text(errno));
  }
}

void TcpStream::write_all(const uint8_t *data, size_t len) {
  const uint8_t *send_ptr = data;
  size_t remaining = len;

  while (remaining > 0) {
    const ssize_t sent = ::send(fd_, send_ptr, remaining, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw IpcError(ErrorCode::Io, "write to " + peer_ + " timed out");
      }
      throw IpcError(ErrorCode::Io,
                     "send to " + peer_ + " failed: " + errno_text(errno));
    }
    if (sent == 0) {
      throw IpcError(ErrorCode::Io, "send to " + peer_ + " wrote 0 bytes");
    }

    send_ptr += sent;
    remaining -= static_cast<size_t>(sent);
  }
}

size_t TcpStream::read_some(uint8_t *buf, size_t len) {
  for (;;) {
    const ssize_t received = ::recv(fd_, buf, len, 0);
    if (received >= 0) {
      return static_cast<size_t>(received);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      throw IpcError(ErrorCode::Io, "read from " + peer_ + " timed out");
    }
    throw IpcError(ErrorCode::Io,
                   "recv from " + peer_ + " failed: " + errno_text(errno));
  }
}

} // namespace ipc_transport
