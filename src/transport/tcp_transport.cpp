#include "transport/tcp_transport.hpp"
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <utility>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include "common/logger.hpp"

namespace diaglink {

TcpTransport::TcpTransport(TcpOptions options)
    : options_(std::move(options)) {
  if (Connect()) {
    DIAGLINK_LOG_DEBUG("Connected to DIAG bridge at {}:{}", options_.host, options_.port);
  }
}

bool TcpTransport::Connect() {
  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *results = nullptr;
  std::string port = std::to_string(options_.port);
  int rc = ::getaddrinfo(options_.host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    DIAGLINK_LOG_DEBUG("Cannot resolve {}: {}", options_.host, ::gai_strerror(rc));
    open_errno_ = EHOSTUNREACH;
    return false;
  }

  for (struct addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      open_errno_ = errno;
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      open_errno_ = errno;
      ::close(fd);
      continue;
    }
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    fd_ = fd;
    open_errno_ = 0;
    break;
  }

  ::freeaddrinfo(results);
  return fd_ >= 0;
}

int TcpTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }

  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int ready = ::poll(&pfd, 1, static_cast<int>(options_.poll_interval_ms));
  if (ready == 0) {
    return 0;
  }
  if (ready < 0) {
    return errno == EINTR ? 0 : -1;
  }

  ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    return -1;
  }
  if (n == 0) {
    DIAGLINK_LOG_DEBUG("DIAG bridge closed the connection");
    return -1;
  }
  return static_cast<int>(n);
}

bool TcpTransport::HasData() const {
  if (fd_ < 0) {
    return false;
  }
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  return ::poll(&pfd, 1, 0) > 0;
}

size_t TcpTransport::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  int n = 0;
  if (::ioctl(fd_, FIONREAD, &n) == 0 && n > 0) {
    return static_cast<size_t>(n);
  }
  return 0;
}

int TcpTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    return -1;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::send(fd_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return -1;
    }
    total += static_cast<size_t>(n);
  }
  return static_cast<int>(total);
}

void TcpTransport::Dispose() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace diaglink
