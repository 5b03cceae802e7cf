#include "usb/usb_bulk_transport.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <libusb-1.0/libusb.h>
#include "common/logger.hpp"
#include "transport/transport_factory.hpp"

namespace diaglink {

OpenError OpenErrorFromLibusb(int err) {
  switch (err) {
    case LIBUSB_SUCCESS:
      return OpenError::kNone;
    case LIBUSB_ERROR_ACCESS:
      return OpenError::kPermissionDenied;
    case LIBUSB_ERROR_NO_DEVICE:
    case LIBUSB_ERROR_NOT_FOUND:
      return OpenError::kDeviceVanished;
    default:
      return OpenError::kOpenFailed;
  }
}

OpenError OpenErrorFromKernelDriverState(int active) {
  switch (active) {
    case 0:
    case LIBUSB_ERROR_NOT_SUPPORTED:  // no kernel driver concept on this platform
      return OpenError::kNone;
    case 1:
      return OpenError::kKernelDriverConflict;
    default:
      return OpenErrorFromLibusb(active);
  }
}

UsbBulkTransport::UsbBulkTransport(const UsbInterfaceInfo &info, UsbOptions options)
    : info_(info),
      options_(options) {
  open_error_ = Open();
  if (open_error_ != OpenError::kNone) {
    // Release whatever was acquired before the failing step
    Dispose();
  }
}

OpenError UsbBulkTransport::Open() {
  if (!info_.bulk_in_endpoint.has_value() || !info_.bulk_out_endpoint.has_value()) {
    DIAGLINK_LOG_ERROR("Interface {} of {:03d}:{:03d} has no bulk IN/OUT endpoint pair", info_.interface_number,
                       info_.bus, info_.address);
    return OpenError::kOpenFailed;
  }

  if (int err = libusb_init(&ctx_); err != LIBUSB_SUCCESS) {
    DIAGLINK_LOG_ERROR("libusb_init failed: {}", libusb_error_name(err));
    ctx_ = nullptr;
    return OpenError::kOpenFailed;
  }

  libusb_device **list = nullptr;
  ssize_t count = libusb_get_device_list(ctx_, &list);
  if (count < 0) {
    DIAGLINK_LOG_ERROR("libusb_get_device_list failed: {}", libusb_error_name(static_cast<int>(count)));
    return OpenError::kOpenFailed;
  }

  int open_rc = LIBUSB_ERROR_NOT_FOUND;
  for (ssize_t i = 0; i < count; ++i) {
    libusb_device *dev = list[i];
    if (libusb_get_bus_number(dev) == info_.bus && libusb_get_device_address(dev) == info_.address) {
      open_rc = libusb_open(dev, &handle_);
      break;
    }
  }
  libusb_free_device_list(list, 1);

  if (open_rc != LIBUSB_SUCCESS) {
    handle_ = nullptr;
    DIAGLINK_LOG_DEBUG("libusb_open {:03d}:{:03d} failed: {}", info_.bus, info_.address, libusb_error_name(open_rc));
    return OpenErrorFromLibusb(open_rc);
  }

  int active = libusb_kernel_driver_active(handle_, info_.interface_number);
  OpenError driver_error = OpenErrorFromKernelDriverState(active);
  if (driver_error == OpenError::kKernelDriverConflict) {
    DIAGLINK_LOG_ERROR("{}", OpenErrorHint(driver_error));
  }
  if (driver_error != OpenError::kNone) {
    return driver_error;
  }

  int current_config = 0;
  if (libusb_get_configuration(handle_, &current_config) == LIBUSB_SUCCESS &&
      current_config != info_.configuration_value) {
    int rc = libusb_set_configuration(handle_, info_.configuration_value);
    if (rc != LIBUSB_SUCCESS) {
      DIAGLINK_LOG_DEBUG("libusb_set_configuration({}) failed: {}", info_.configuration_value, libusb_error_name(rc));
      return OpenErrorFromLibusb(rc);
    }
  }

  int rc = libusb_claim_interface(handle_, info_.interface_number);
  if (rc != LIBUSB_SUCCESS) {
    DIAGLINK_LOG_DEBUG("libusb_claim_interface({}) failed: {}", info_.interface_number, libusb_error_name(rc));
    return OpenErrorFromLibusb(rc);
  }
  claimed_ = true;

  DIAGLINK_LOG_DEBUG("Claimed interface {} of {:04x}:{:04x} (IN 0x{:02x}, OUT 0x{:02x})", info_.interface_number,
                     info_.vendor_id, info_.product_id, *info_.bulk_in_endpoint, *info_.bulk_out_endpoint);
  return OpenError::kNone;
}

int UsbBulkTransport::Read(std::span<uint8_t> buffer) {
  if (!IsOpen()) {
    return -1;
  }

  int transferred = 0;
  int rc = libusb_bulk_transfer(handle_, *info_.bulk_in_endpoint, buffer.data(), static_cast<int>(buffer.size()),
                                &transferred, options_.read_timeout_ms);
  switch (rc) {
    case LIBUSB_SUCCESS:
    case LIBUSB_ERROR_TIMEOUT:
      return transferred;
    case LIBUSB_ERROR_INTERRUPTED:
      return 0;
    default:
      DIAGLINK_LOG_DEBUG("Bulk IN transfer failed: {}", libusb_error_name(rc));
      return -1;
  }
}

int UsbBulkTransport::Write(std::span<const uint8_t> data) {
  if (!IsOpen()) {
    return -1;
  }

  int transferred = 0;
  // libusb takes a non-const buffer for both directions; OUT transfers do not modify it
  int rc = libusb_bulk_transfer(handle_, *info_.bulk_out_endpoint, const_cast<uint8_t *>(data.data()),
                                static_cast<int>(data.size()), &transferred, options_.write_timeout_ms);
  if (rc != LIBUSB_SUCCESS) {
    DIAGLINK_LOG_DEBUG("Bulk OUT transfer failed: {}", libusb_error_name(rc));
    return -1;
  }
  return transferred;
}

void UsbBulkTransport::Dispose() {
  if (handle_ != nullptr) {
    if (claimed_) {
      libusb_release_interface(handle_, info_.interface_number);
      claimed_ = false;
    }
    libusb_close(handle_);
    handle_ = nullptr;
  }
  if (ctx_ != nullptr) {
    libusb_exit(ctx_);
    ctx_ = nullptr;
  }
}

}  // namespace diaglink
