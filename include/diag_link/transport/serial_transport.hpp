/**
 * @file serial_transport.hpp
 * @brief POSIX serial/character device transport
 *
 * Used when a kernel driver (usbserial, option, qcserial, hso, ...) already
 * exposes the DIAG interface as a tty, e.g. /dev/ttyUSB0 or /dev/ttyHS0.
 *
 * Usage:
 *   SerialTransport transport("/dev/ttyUSB0");
 *   if (!transport.IsOpen()) { ... transport.GetOpenErrno() ... }
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include "../common/session_options.hpp"
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace diaglink {

/**
 * @brief Raw-mode termios transport over a tty device
 *
 * Opens and configures the port in the constructor; check IsOpen(). Read()
 * waits at most SerialOptions::poll_interval_ms for data.
 */
class SerialTransport : public ByteTransport {
 public:
  explicit SerialTransport(std::string port_name, SerialOptions options = {});
  ~SerialTransport() override { Dispose(); }

  SerialTransport(const SerialTransport &) = delete;
  SerialTransport &operator=(const SerialTransport &) = delete;

  SerialTransport(SerialTransport &&other) noexcept;
  SerialTransport &operator=(SerialTransport &&other) noexcept;

  [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }

  /**
   * @brief errno of the failed open/configure step, 0 if the port opened
   */
  [[nodiscard]] int GetOpenErrno() const { return open_errno_; }

  [[nodiscard]] const std::string &GetPortName() const { return port_name_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override;

  void Dispose() override;

 private:
  bool Open();

  std::string port_name_;
  SerialOptions options_;
  int fd_{-1};
  int open_errno_{0};
};

}  // namespace diaglink
