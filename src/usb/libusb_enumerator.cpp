#include "usb/libusb_enumerator.hpp"
#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>
#include <libusb-1.0/libusb.h>
#include "common/logger.hpp"
#include "usb/sysfs_chardev.hpp"
#include "usb/usb_interface_info.hpp"

namespace diaglink {

namespace {

constexpr int kMaxPortDepth = 7;

void FillEndpoints(const libusb_interface_descriptor &alt, UsbInterfaceInfo &info) {
  info.num_endpoints = alt.bNumEndpoints;
  for (uint8_t e = 0; e < alt.bNumEndpoints; ++e) {
    const libusb_endpoint_descriptor &ep = alt.endpoint[e];
    if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) {
      continue;
    }
    if ((ep.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN) {
      if (!info.bulk_in_endpoint.has_value()) {
        info.bulk_in_endpoint = ep.bEndpointAddress;
      }
    } else if (!info.bulk_out_endpoint.has_value()) {
      info.bulk_out_endpoint = ep.bEndpointAddress;
    }
  }
}

}  // namespace

LibusbEnumerator::LibusbEnumerator(std::filesystem::path sysfs_root, std::filesystem::path dev_root)
    : sysfs_root_(std::move(sysfs_root)),
      dev_root_(std::move(dev_root)) {
  if (int err = libusb_init(&ctx_); err != LIBUSB_SUCCESS) {
    DIAGLINK_LOG_ERROR("libusb_init failed: {}", libusb_error_name(err));
    ctx_ = nullptr;
  }
}

LibusbEnumerator::~LibusbEnumerator() {
  if (ctx_ != nullptr) {
    libusb_exit(ctx_);
    ctx_ = nullptr;
  }
}

std::vector<UsbInterfaceInfo> LibusbEnumerator::Enumerate() {
  std::vector<UsbInterfaceInfo> interfaces;
  if (ctx_ == nullptr) {
    return interfaces;
  }

  libusb_device **list = nullptr;
  ssize_t count = libusb_get_device_list(ctx_, &list);
  if (count < 0) {
    DIAGLINK_LOG_ERROR("libusb_get_device_list failed: {}", libusb_error_name(static_cast<int>(count)));
    return interfaces;
  }

  for (ssize_t i = 0; i < count; ++i) {
    AppendDeviceInterfaces(list[i], interfaces);
  }

  libusb_free_device_list(list, 1);
  return interfaces;
}

void LibusbEnumerator::AppendDeviceInterfaces(libusb_device *device, std::vector<UsbInterfaceInfo> &out) const {
  libusb_device_descriptor desc{};
  if (libusb_get_device_descriptor(device, &desc) != LIBUSB_SUCCESS) {
    return;
  }

  uint8_t ports[kMaxPortDepth];
  int depth = libusb_get_port_numbers(device, ports, kMaxPortDepth);
  std::vector<uint8_t> port_path;
  if (depth > 0) {
    port_path.assign(ports, ports + depth);
  }

  for (uint8_t c = 0; c < desc.bNumConfigurations; ++c) {
    libusb_config_descriptor *config = nullptr;
    if (libusb_get_config_descriptor(device, c, &config) != LIBUSB_SUCCESS) {
      continue;
    }

    for (uint8_t n = 0; n < config->bNumInterfaces; ++n) {
      const libusb_interface &intf = config->interface[n];
      if (intf.num_altsetting < 1) {
        continue;
      }
      const libusb_interface_descriptor &alt = intf.altsetting[0];

      UsbInterfaceInfo info;
      info.bus = libusb_get_bus_number(device);
      info.address = libusb_get_device_address(device);
      info.port_path = port_path;
      info.vendor_id = desc.idVendor;
      info.product_id = desc.idProduct;
      info.configuration_value = config->bConfigurationValue;
      info.interface_number = alt.bInterfaceNumber;
      info.interface_class = alt.bInterfaceClass;
      info.interface_subclass = alt.bInterfaceSubClass;
      info.interface_protocol = alt.bInterfaceProtocol;
      FillEndpoints(alt, info);
      info.kernel_driver_active =
          IsKernelDriverBound(sysfs_root_, info.bus, info.port_path, info.configuration_value, info.interface_number);
      info.chardev_path = FindChardevForInterface(sysfs_root_, dev_root_, info.bus, info.port_path,
                                                  info.configuration_value, info.interface_number);
      out.push_back(std::move(info));
    }

    libusb_free_config_descriptor(config);
  }
}

}  // namespace diaglink
