#pragma once

#include <filesystem>
#include <vector>
#include "device_selector.hpp"
#include "sysfs_chardev.hpp"
#include "usb_interface_info.hpp"

struct libusb_context;
struct libusb_device;

namespace diaglink {

/**
 * @brief Lists attached USB interfaces with libusb
 *
 * Descriptors are read without opening devices, so enumeration needs no
 * special rights. Kernel driver binding and exposed tty names come from
 * sysfs.
 */
class LibusbEnumerator : public UsbEnumerator {
 public:
  explicit LibusbEnumerator(std::filesystem::path sysfs_root = kDefaultSysfsUsbRoot,
                            std::filesystem::path dev_root = kDefaultDevRoot);
  ~LibusbEnumerator() override;

  LibusbEnumerator(const LibusbEnumerator &) = delete;
  LibusbEnumerator &operator=(const LibusbEnumerator &) = delete;

  [[nodiscard]] bool IsInitialized() const noexcept { return ctx_ != nullptr; }

  [[nodiscard]] std::vector<UsbInterfaceInfo> Enumerate() override;

 private:
  void AppendDeviceInterfaces(libusb_device *device, std::vector<UsbInterfaceInfo> &out) const;

  libusb_context *ctx_{nullptr};
  std::filesystem::path sysfs_root_;
  std::filesystem::path dev_root_;
};

}  // namespace diaglink
