#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "../common/session_options.hpp"
#include "../transport/byte_reader.hpp"
#include "../transport/byte_writer.hpp"
#include "../transport/transport_factory.hpp"
#include "usb_interface_info.hpp"

struct libusb_context;
struct libusb_device_handle;

namespace diaglink {

/**
 * @brief Map a libusb error code from open/claim/set-configuration to an OpenError
 */
[[nodiscard]] OpenError OpenErrorFromLibusb(int err);

/**
 * @brief Map the result of libusb_kernel_driver_active() to an OpenError
 *
 * 1 (driver bound) is kKernelDriverConflict; 0 and LIBUSB_ERROR_NOT_SUPPORTED
 * are kNone; any other error maps like OpenErrorFromLibusb().
 */
[[nodiscard]] OpenError OpenErrorFromKernelDriverState(int active);

/**
 * @brief ByteTransport over a pair of USB bulk endpoints (libusb)
 *
 * The constructor opens the device at info.bus/info.address, refuses to go
 * on if a kernel driver is bound to the interface (GetOpenError() ==
 * kKernelDriverConflict), then claims the interface. A bulk IN timeout is
 * reported as "no data yet".
 */
class UsbBulkTransport : public ByteTransport {
 public:
  explicit UsbBulkTransport(const UsbInterfaceInfo &info, UsbOptions options = {});
  ~UsbBulkTransport() override { Dispose(); }

  UsbBulkTransport(const UsbBulkTransport &) = delete;
  UsbBulkTransport &operator=(const UsbBulkTransport &) = delete;

  [[nodiscard]] bool IsOpen() const noexcept { return handle_ != nullptr && claimed_; }
  [[nodiscard]] OpenError GetOpenError() const noexcept { return open_error_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override { return false; }
  [[nodiscard]] size_t AvailableBytes() const override { return 0; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override { return IsOpen(); }

  void Dispose() override;

 private:
  OpenError Open();

  UsbInterfaceInfo info_;
  UsbOptions options_;
  libusb_context *ctx_{nullptr};
  libusb_device_handle *handle_{nullptr};
  bool claimed_{false};
  OpenError open_error_{OpenError::kNone};
};

}  // namespace diaglink
