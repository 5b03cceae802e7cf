/**
 * @file tcp_transport.hpp
 * @brief TCP client transport for a forwarded DIAG bridge
 *
 * A rooted Android phone can expose its DIAG character device over a TCP
 * socket, forwarded to the host with "adb forward tcp:43555 tcp:43555".
 * The bytes on that socket are the same HDLC frames a USB modem sends.
 *
 * Usage:
 *   TcpTransport transport(TcpOptions{"127.0.0.1", 43555});
 *   if (!transport.IsOpen()) { ... }
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "../common/session_options.hpp"
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace diaglink {

/**
 * @brief ByteTransport over a connected TCP socket
 *
 * Owns the socket; closes it on Dispose() or destruction. A peer closing the
 * connection is reported as a read failure.
 */
class TcpTransport : public ByteTransport {
 public:
  /**
   * @brief Connect to options.host:options.port; check IsOpen()
   */
  explicit TcpTransport(TcpOptions options);

  /**
   * @brief Wrap an already-connected socket fd (ownership taken)
   */
  explicit TcpTransport(int fd, uint32_t poll_interval_ms = TcpOptions{}.poll_interval_ms)
      : fd_(fd) {
    options_.poll_interval_ms = poll_interval_ms;
  }

  ~TcpTransport() override { Dispose(); }

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }
  [[nodiscard]] int GetOpenErrno() const { return open_errno_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override { return fd_ >= 0; }

  void Dispose() override;

 private:
  bool Connect();

  TcpOptions options_{};
  int fd_{-1};
  int open_errno_{0};
};

}  // namespace diaglink
