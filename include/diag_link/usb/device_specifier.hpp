#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace diaglink {

enum class SpecifierKind : uint8_t {
  kAuto,
  kPath,
  kVendorProduct,
  kBusAddress,
};

/**
 * @brief Explicit configuration value / interface number refinement
 */
struct InterfaceRef {
  uint8_t configuration_value{0};
  uint8_t interface_number{0};

  bool operator==(const InterfaceRef &other) const = default;
};

/**
 * @brief Parsed user device specifier
 *
 * Accepted syntaxes:
 *   - "auto"
 *   - a character device path ("/dev/ttyUSB0", "/dev/ttyHS0") or "COM<n>"
 *   - "VVVV:PPPP[:cfg:intf]": four-digit hex vendor/product ids, e.g. "05c6:9091:1:0"
 *   - "BBB:AAA[:cfg:intf]": three-digit decimal bus/address, e.g. "001:003:1:3"
 * cfg and intf are decimal and must be given together.
 */
class DeviceSpecifier {
 public:
  /**
   * @brief Parse a user string
   * @return Specifier, or empty optional if the string matches no syntax
   */
  [[nodiscard]] static std::optional<DeviceSpecifier> Parse(std::string_view text);

  [[nodiscard]] static DeviceSpecifier Auto() { return DeviceSpecifier(SpecifierKind::kAuto); }
  [[nodiscard]] static DeviceSpecifier Path(std::string path);
  [[nodiscard]] static DeviceSpecifier VendorProduct(uint16_t vendor_id, uint16_t product_id,
                                                     std::optional<InterfaceRef> interface_ref = {});
  [[nodiscard]] static DeviceSpecifier BusAddress(uint8_t bus, uint8_t address,
                                                  std::optional<InterfaceRef> interface_ref = {});

  [[nodiscard]] SpecifierKind GetKind() const noexcept { return kind_; }
  [[nodiscard]] const std::string &GetPath() const noexcept { return path_; }
  [[nodiscard]] uint16_t GetVendorId() const noexcept { return vendor_id_; }
  [[nodiscard]] uint16_t GetProductId() const noexcept { return product_id_; }
  [[nodiscard]] uint8_t GetBus() const noexcept { return bus_; }
  [[nodiscard]] uint8_t GetAddress() const noexcept { return address_; }
  [[nodiscard]] const std::optional<InterfaceRef> &GetInterfaceRef() const noexcept { return interface_ref_; }

  /**
   * @brief Human-readable form, e.g. "05c6:9091:1:0"
   */
  [[nodiscard]] std::string ToString() const;

 private:
  explicit DeviceSpecifier(SpecifierKind kind)
      : kind_(kind) {}

  SpecifierKind kind_;
  std::string path_{};
  uint16_t vendor_id_{0};
  uint16_t product_id_{0};
  uint8_t bus_{0};
  uint8_t address_{0};
  std::optional<InterfaceRef> interface_ref_{};
};

}  // namespace diaglink
