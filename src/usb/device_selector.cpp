#include "usb/device_selector.hpp"
#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "common/logger.hpp"
#include "usb/device_specifier.hpp"
#include "usb/usb_interface_info.hpp"

namespace diaglink {

const char *NotFoundReasonToString(NotFoundReason reason) {
  switch (reason) {
    case NotFoundReason::kNoMatchingInterface:
      return "no matching interface";
    case NotFoundReason::kAmbiguous:
      return "ambiguous device specifier";
    case NotFoundReason::kKernelDriverActiveNoChardev:
      return "kernel driver active without character device";
    case NotFoundReason::kExplicitTargetAbsent:
      return "specified device not attached";
  }
  return "unknown";
}

const char *RemediationHint(NotFoundReason reason) {
  switch (reason) {
    case NotFoundReason::kNoMatchingInterface:
      return "No DIAG interface was found with the specified criteria. Please be more specific, "
             "e.g. pass \"vid:pid:cfg:intf\" or a device path.";
    case NotFoundReason::kAmbiguous:
      return "Several attached devices match. Please pass \"bus:addr\" to pick one.";
    case NotFoundReason::kKernelDriverActiveNoChardev:
      return "The USB interface is taken by a kernel driver that exposes no serial device. "
             "Please pass a device path such as /dev/ttyUSB2 or /dev/ttyHS0, or unload the driver.";
    case NotFoundReason::kExplicitTargetAbsent:
      return "The specified USB device is not attached. Check the ids with lsusb.";
  }
  return "";
}

ResolvedDevice ResolvedDevice::FromInterface(UsbInterfaceInfo info) {
  ResolvedDevice device(ResolvedKind::kUsbInterface);
  device.interface_ = std::move(info);
  return device;
}

ResolvedDevice ResolvedDevice::FromChardev(std::string path) {
  ResolvedDevice device(ResolvedKind::kChardev);
  device.chardev_path_ = std::move(path);
  return device;
}

ResolvedDevice ResolvedDevice::NotFound(NotFoundReason reason) {
  ResolvedDevice device(ResolvedKind::kNotFound);
  device.not_found_reason_ = reason;
  return device;
}

std::optional<UsbInterfaceInfo> DeviceSelector::MatchInterface(std::span<const UsbInterfaceInfo> candidates) {
  for (const MatchRule &rule : {kDiagPrimaryRule, kDiagFallbackRule}) {
    auto it = std::find_if(candidates.begin(), candidates.end(),
                           [&rule](const UsbInterfaceInfo &info) { return rule.Matches(info); });
    if (it != candidates.end()) {
      return *it;
    }
  }
  return {};
}

ResolvedDevice DeviceSelector::Finalize(const UsbInterfaceInfo &info) {
  if (info.chardev_path.has_value()) {
    DIAGLINK_LOG_DEBUG("Interface {:03d}:{:03d} cfg {} intf {} is mounted as {}", info.bus, info.address,
                       info.configuration_value, info.interface_number, *info.chardev_path);
    return ResolvedDevice::FromChardev(*info.chardev_path);
  }
  if (info.kernel_driver_active) {
    return ResolvedDevice::NotFound(NotFoundReason::kKernelDriverActiveNoChardev);
  }
  return ResolvedDevice::FromInterface(info);
}

ResolvedDevice DeviceSelector::ResolveExplicit(const DeviceSpecifier &specifier,
                                               const std::vector<UsbInterfaceInfo> &all) {
  std::vector<UsbInterfaceInfo> on_device;
  std::copy_if(all.begin(), all.end(), std::back_inserter(on_device), [&specifier](const UsbInterfaceInfo &info) {
    if (specifier.GetKind() == SpecifierKind::kVendorProduct) {
      return info.vendor_id == specifier.GetVendorId() && info.product_id == specifier.GetProductId();
    }
    return info.bus == specifier.GetBus() && info.address == specifier.GetAddress();
  });

  if (on_device.empty()) {
    return ResolvedDevice::NotFound(NotFoundReason::kExplicitTargetAbsent);
  }
  bool single_device = std::all_of(on_device.begin(), on_device.end(), [&on_device](const UsbInterfaceInfo &info) {
    return info.SameDevice(on_device.front());
  });
  if (!single_device) {
    return ResolvedDevice::NotFound(NotFoundReason::kAmbiguous);
  }

  const auto &interface_ref = specifier.GetInterfaceRef();
  if (interface_ref.has_value()) {
    auto it = std::find_if(on_device.begin(), on_device.end(), [&interface_ref](const UsbInterfaceInfo &info) {
      return info.configuration_value == interface_ref->configuration_value &&
             info.interface_number == interface_ref->interface_number;
    });
    if (it == on_device.end()) {
      return ResolvedDevice::NotFound(NotFoundReason::kNoMatchingInterface);
    }
    return Finalize(*it);
  }

  auto match = MatchInterface(on_device);
  if (!match.has_value()) {
    return ResolvedDevice::NotFound(NotFoundReason::kNoMatchingInterface);
  }
  return Finalize(*match);
}

ResolvedDevice DeviceSelector::Resolve(const DeviceSpecifier &specifier) const {
  if (specifier.GetKind() == SpecifierKind::kPath) {
    return ResolvedDevice::FromChardev(specifier.GetPath());
  }

  std::vector<UsbInterfaceInfo> all = enumerator_.Enumerate();
  DIAGLINK_LOG_DEBUG("Enumerated {} USB interfaces for \"{}\"", all.size(), specifier.ToString());

  if (specifier.GetKind() == SpecifierKind::kAuto) {
    auto match = MatchInterface(all);
    if (!match.has_value()) {
      return ResolvedDevice::NotFound(NotFoundReason::kNoMatchingInterface);
    }
    return Finalize(*match);
  }

  return ResolveExplicit(specifier, all);
}

}  // namespace diaglink
