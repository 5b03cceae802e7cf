#include "usb/sysfs_chardev.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <fmt/core.h>

namespace diaglink {

namespace {

constexpr std::array<std::string_view, 3> kTtyPrefixes{"ttyUSB", "ttyACM", "ttyHS"};

bool IsTtyName(const std::string &name) {
  return std::any_of(kTtyPrefixes.begin(), kTtyPrefixes.end(), [&name](std::string_view prefix) {
    return name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0;
  });
}

std::vector<std::string> ListTtyNames(const std::filesystem::path &dir) {
  std::vector<std::string> names;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return names;
  }
  for (const auto &entry : it) {
    std::string name = entry.path().filename().string();
    if (IsTtyName(name)) {
      names.push_back(std::move(name));
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace

std::optional<std::string> SysfsInterfaceName(uint8_t bus, std::span<const uint8_t> port_path,
                                              uint8_t configuration_value, uint8_t interface_number) {
  if (port_path.empty()) {
    return {};
  }
  std::string name = fmt::format("{}-{}", bus, port_path[0]);
  for (size_t i = 1; i < port_path.size(); ++i) {
    name += fmt::format(".{}", port_path[i]);
  }
  name += fmt::format(":{}.{}", configuration_value, interface_number);
  return name;
}

bool IsKernelDriverBound(const std::filesystem::path &sysfs_root, uint8_t bus, std::span<const uint8_t> port_path,
                         uint8_t configuration_value, uint8_t interface_number) {
  auto name = SysfsInterfaceName(bus, port_path, configuration_value, interface_number);
  if (!name.has_value()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(sysfs_root / *name / "driver", ec);
}

std::optional<std::string> FindChardevForInterface(const std::filesystem::path &sysfs_root,
                                                   const std::filesystem::path &dev_root, uint8_t bus,
                                                   std::span<const uint8_t> port_path, uint8_t configuration_value,
                                                   uint8_t interface_number) {
  auto name = SysfsInterfaceName(bus, port_path, configuration_value, interface_number);
  if (!name.has_value()) {
    return {};
  }
  std::filesystem::path interface_dir = sysfs_root / *name;

  for (const auto &dir : {interface_dir, interface_dir / "tty"}) {
    auto names = ListTtyNames(dir);
    if (!names.empty()) {
      return (dev_root / names.front()).string();
    }
  }
  return {};
}

}  // namespace diaglink
