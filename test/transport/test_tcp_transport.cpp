#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "diag_link/common/session_options.hpp"
#include "diag_link/transport/tcp_transport.hpp"
#include "diag_link/transport/transport_factory.hpp"

using diaglink::OpenError;
using diaglink::OpenTcpTransport;
using diaglink::TcpOptions;
using diaglink::TcpTransport;

namespace {

// Loopback listener on an ephemeral port
class Listener {
 public:
  Listener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 1) != 0) {
      return;
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  ~Listener() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  Listener(const Listener &) = delete;
  Listener &operator=(const Listener &) = delete;

  [[nodiscard]] uint16_t GetPort() const { return port_; }
  [[nodiscard]] int Accept() const { return ::accept(fd_, nullptr, nullptr); }

 private:
  int fd_{-1};
  uint16_t port_{0};
};

}  // namespace

TEST(TcpTransport, ReadIdlesThenReceives) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TcpTransport transport(fds[0], 20);
  ASSERT_TRUE(transport.IsOpen());

  std::vector<uint8_t> buffer(16);
  EXPECT_EQ(transport.Read(buffer), 0);
  EXPECT_FALSE(transport.HasData());

  std::vector<uint8_t> sent{0x01, 0x41, 0x12, 0x45, 0x7E};
  ASSERT_EQ(::write(fds[1], sent.data(), sent.size()), static_cast<ssize_t>(sent.size()));
  EXPECT_TRUE(transport.HasData());
  EXPECT_EQ(transport.AvailableBytes(), sent.size());

  int n = transport.Read(buffer);
  ASSERT_EQ(n, static_cast<int>(sent.size()));
  buffer.resize(static_cast<size_t>(n));
  EXPECT_EQ(buffer, sent);
  ::close(fds[1]);
}

TEST(TcpTransport, PeerCloseIsFatal) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TcpTransport transport(fds[0], 20);
  ::close(fds[1]);

  std::vector<uint8_t> buffer(16);
  EXPECT_EQ(transport.Read(buffer), -1);
}

TEST(TcpTransport, WriteReachesPeer) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TcpTransport transport(fds[0], 20);

  std::vector<uint8_t> request{0x00, 0x78, 0xF0, 0x7E};
  EXPECT_EQ(transport.Write(request), 4);
  EXPECT_TRUE(transport.Flush());

  std::vector<uint8_t> received(16);
  ssize_t n = ::read(fds[1], received.data(), received.size());
  ASSERT_EQ(n, 4);
  received.resize(4);
  EXPECT_EQ(received, request);
  ::close(fds[1]);
}

TEST(TcpTransport, DisposeIsIdempotent) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TcpTransport transport(fds[0], 20);
  transport.Dispose();
  transport.Dispose();
  EXPECT_FALSE(transport.IsOpen());

  std::vector<uint8_t> buffer(4);
  EXPECT_EQ(transport.Read(buffer), -1);
  EXPECT_EQ(transport.Write(buffer), -1);
  ::close(fds[1]);
}

TEST(TcpTransport, ConnectsToLoopbackBridge) {
  Listener listener;
  ASSERT_NE(listener.GetPort(), 0);

  TcpOptions options;
  options.host = "127.0.0.1";
  options.port = listener.GetPort();
  options.poll_interval_ms = 20;
  auto result = OpenTcpTransport(options);
  ASSERT_TRUE(result.Ok());

  int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  std::vector<uint8_t> sent{0x7E};
  ASSERT_EQ(::write(peer, sent.data(), sent.size()), 1);
  std::vector<uint8_t> buffer(8);
  int n = 0;
  for (int attempt = 0; attempt < 50 && n == 0; ++attempt) {
    n = result.transport->Read(buffer);
  }
  EXPECT_EQ(n, 1);
  EXPECT_EQ(buffer[0], 0x7E);
  ::close(peer);
}

TEST(TcpTransport, RefusedConnectionIsReported) {
  uint16_t port = 0;
  {
    Listener listener;
    port = listener.GetPort();
  }
  ASSERT_NE(port, 0);

  TcpOptions options;
  options.port = port;
  auto result = OpenTcpTransport(options);
  EXPECT_FALSE(result.Ok());
  EXPECT_EQ(result.error, OpenError::kOpenFailed);
}

TEST(TcpTransport, DefaultsPointAtForwardedBridge) {
  TcpOptions options;
  EXPECT_EQ(options.host, "127.0.0.1");
  EXPECT_EQ(options.port, 43555);
}
