#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace diaglink {

static constexpr const char *kDefaultSysfsUsbRoot = "/sys/bus/usb/devices";
static constexpr const char *kDefaultDevRoot = "/dev";

/**
 * @brief sysfs directory name of a USB interface, e.g. "1-1.4:1.3"
 *
 * @param bus Bus number
 * @param port_path Hub ports from the root hub down (non-empty)
 * @return Directory name, or empty optional for a root hub (empty port path)
 */
[[nodiscard]] std::optional<std::string> SysfsInterfaceName(uint8_t bus, std::span<const uint8_t> port_path,
                                                            uint8_t configuration_value, uint8_t interface_number);

/**
 * @brief Whether a kernel driver is bound to the interface
 *
 * Checks for the "driver" link in the interface's sysfs directory, which
 * needs no device access rights.
 */
[[nodiscard]] bool IsKernelDriverBound(const std::filesystem::path &sysfs_root, uint8_t bus,
                                       std::span<const uint8_t> port_path, uint8_t configuration_value,
                                       uint8_t interface_number);

/**
 * @brief Find the character device a kernel driver exposes for an interface
 *
 * Looks for ttyUSB*, ttyACM* or ttyHS* entries directly in the interface
 * directory (usbserial-style drivers) or under its tty/ subdirectory
 * (cdc-acm, hso). The first name in lexical order wins.
 *
 * @return "<dev_root>/<name>", or empty optional if none is exposed
 */
[[nodiscard]] std::optional<std::string> FindChardevForInterface(const std::filesystem::path &sysfs_root,
                                                                 const std::filesystem::path &dev_root, uint8_t bus,
                                                                 std::span<const uint8_t> port_path,
                                                                 uint8_t configuration_value,
                                                                 uint8_t interface_number);

}  // namespace diaglink
