#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace diaglink {

/**
 * @brief Enumeration record for one interface of one attached USB device
 *
 * Only the first alternate setting of each interface is described.
 */
struct UsbInterfaceInfo {
  uint8_t bus{0};
  uint8_t address{0};
  /** Hub port numbers from the root hub down, as used in sysfs names. */
  std::vector<uint8_t> port_path{};
  uint16_t vendor_id{0};
  uint16_t product_id{0};
  uint8_t configuration_value{0};
  uint8_t interface_number{0};
  uint8_t interface_class{0};
  uint8_t interface_subclass{0};
  uint8_t interface_protocol{0};
  uint8_t num_endpoints{0};
  std::optional<uint8_t> bulk_in_endpoint{};
  std::optional<uint8_t> bulk_out_endpoint{};
  /** A kernel driver (usbserial, option, qcserial, hso, ...) is bound to the interface. */
  bool kernel_driver_active{false};
  /** Character device the bound driver exposes for this interface, if any. */
  std::optional<std::string> chardev_path{};

  [[nodiscard]] bool SameDevice(const UsbInterfaceInfo &other) const noexcept {
    return bus == other.bus && address == other.address;
  }
};

/**
 * @brief Interface signature used to recognise a DIAG interface
 */
struct MatchRule {
  uint8_t interface_class;
  uint8_t interface_subclass;
  uint8_t interface_protocol;
  uint8_t num_endpoints;

  [[nodiscard]] bool Matches(const UsbInterfaceInfo &info) const noexcept {
    return info.interface_class == interface_class && info.interface_subclass == interface_subclass &&
           info.interface_protocol == interface_protocol && info.num_endpoints == num_endpoints;
  }
};

/** Vendor-specific class with the DIAG protocol code; preferred. */
static constexpr MatchRule kDiagPrimaryRule{0xFF, 0xFF, 0x30, 2};
/** Vendor-specific class with vendor-specific protocol and one bulk pair; fallback. */
static constexpr MatchRule kDiagFallbackRule{0xFF, 0xFF, 0xFF, 2};

}  // namespace diaglink
