#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "device_specifier.hpp"
#include "usb_interface_info.hpp"

namespace diaglink {

/**
 * @brief Why no usable device could be resolved
 */
enum class NotFoundReason : uint8_t {
  kNoMatchingInterface,
  kAmbiguous,
  kKernelDriverActiveNoChardev,
  kExplicitTargetAbsent,
};

[[nodiscard]] const char *NotFoundReasonToString(NotFoundReason reason);

/**
 * @brief Operator-facing advice for a resolution failure
 */
[[nodiscard]] const char *RemediationHint(NotFoundReason reason);

enum class ResolvedKind : uint8_t {
  kUsbInterface,
  kChardev,
  kNotFound,
};

/**
 * @brief Outcome of device selection
 *
 * Exactly one of interface, chardev path and not-found reason is set.
 */
class ResolvedDevice {
 public:
  [[nodiscard]] static ResolvedDevice FromInterface(UsbInterfaceInfo info);
  [[nodiscard]] static ResolvedDevice FromChardev(std::string path);
  [[nodiscard]] static ResolvedDevice NotFound(NotFoundReason reason);

  [[nodiscard]] ResolvedKind GetKind() const noexcept { return kind_; }
  [[nodiscard]] bool IsFound() const noexcept { return kind_ != ResolvedKind::kNotFound; }

  [[nodiscard]] const std::optional<UsbInterfaceInfo> &GetInterface() const noexcept { return interface_; }
  [[nodiscard]] const std::optional<std::string> &GetChardevPath() const noexcept { return chardev_path_; }
  [[nodiscard]] std::optional<NotFoundReason> GetNotFoundReason() const noexcept { return not_found_reason_; }

 private:
  explicit ResolvedDevice(ResolvedKind kind)
      : kind_(kind) {}

  ResolvedKind kind_;
  std::optional<UsbInterfaceInfo> interface_{};
  std::optional<std::string> chardev_path_{};
  std::optional<NotFoundReason> not_found_reason_{};
};

/**
 * @brief Source of attached USB interfaces
 */
class UsbEnumerator {
 public:
  virtual ~UsbEnumerator() = default;

  /**
   * @brief List every interface of every attached device, in bus enumeration order
   */
  [[nodiscard]] virtual std::vector<UsbInterfaceInfo> Enumerate() = 0;
};

/**
 * @brief Resolves a DeviceSpecifier to a concrete endpoint
 *
 * "auto" takes the first interface matching kDiagPrimaryRule across all
 * devices, then the first matching kDiagFallbackRule. Explicit vendor/product
 * or bus/address specifiers restrict the search to one device; with cfg/intf
 * the exact interface is taken without matching.
 *
 * A resolved interface that a kernel driver already exposes as a character
 * device resolves to that path instead of the raw interface.
 */
class DeviceSelector {
 public:
  explicit DeviceSelector(UsbEnumerator &enumerator)
      : enumerator_(enumerator) {}

  [[nodiscard]] ResolvedDevice Resolve(const DeviceSpecifier &specifier) const;

  /**
   * @brief Apply the two ordered match rules to a candidate list
   * @return First primary-rule match, else first fallback-rule match
   */
  [[nodiscard]] static std::optional<UsbInterfaceInfo> MatchInterface(std::span<const UsbInterfaceInfo> candidates);

 private:
  [[nodiscard]] static ResolvedDevice Finalize(const UsbInterfaceInfo &info);
  [[nodiscard]] static ResolvedDevice ResolveExplicit(const DeviceSpecifier &specifier,
                                                      const std::vector<UsbInterfaceInfo> &all);

  UsbEnumerator &enumerator_;
};

}  // namespace diaglink
