#include "usb/device_specifier.hpp"
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <fmt/core.h>

namespace diaglink {

namespace {

constexpr size_t kIdDigits = 4;
constexpr size_t kBusAddressDigits = 3;
constexpr size_t kMaxRefDigits = 3;

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      fields.push_back(text.substr(start));
      return fields;
    }
    fields.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::optional<uint32_t> ParseNumber(std::string_view field, int base) {
  if (field.empty()) {
    return {};
  }
  uint32_t value = 0;
  for (char c : field) {
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (base == 16 && std::isxdigit(static_cast<unsigned char>(c))) {
      digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    } else {
      return {};
    }
    value = value * static_cast<uint32_t>(base) + static_cast<uint32_t>(digit);
  }
  return value;
}

std::optional<uint8_t> ParseDecimalByte(std::string_view field, size_t max_digits) {
  if (field.size() > max_digits) {
    return {};
  }
  auto value = ParseNumber(field, 10);
  if (!value.has_value() || *value > 0xFF) {
    return {};
  }
  return static_cast<uint8_t>(*value);
}

bool IsComPort(std::string_view text) {
  if (text.size() < 4 || text.substr(0, 3) != "COM") {
    return false;
  }
  return ParseNumber(text.substr(3), 10).has_value();
}

}  // namespace

DeviceSpecifier DeviceSpecifier::Path(std::string path) {
  DeviceSpecifier spec(SpecifierKind::kPath);
  spec.path_ = std::move(path);
  return spec;
}

DeviceSpecifier DeviceSpecifier::VendorProduct(uint16_t vendor_id, uint16_t product_id,
                                               std::optional<InterfaceRef> interface_ref) {
  DeviceSpecifier spec(SpecifierKind::kVendorProduct);
  spec.vendor_id_ = vendor_id;
  spec.product_id_ = product_id;
  spec.interface_ref_ = interface_ref;
  return spec;
}

DeviceSpecifier DeviceSpecifier::BusAddress(uint8_t bus, uint8_t address, std::optional<InterfaceRef> interface_ref) {
  DeviceSpecifier spec(SpecifierKind::kBusAddress);
  spec.bus_ = bus;
  spec.address_ = address;
  spec.interface_ref_ = interface_ref;
  return spec;
}

std::optional<DeviceSpecifier> DeviceSpecifier::Parse(std::string_view text) {
  if (text == "auto") {
    return Auto();
  }
  if (!text.empty() && text.front() == '/') {
    return Path(std::string(text));
  }
  if (IsComPort(text)) {
    return Path(std::string(text));
  }

  auto fields = Split(text, ':');
  if (fields.size() != 2 && fields.size() != 4) {
    return {};
  }

  std::optional<InterfaceRef> interface_ref;
  if (fields.size() == 4) {
    auto cfg = ParseDecimalByte(fields[2], kMaxRefDigits);
    auto intf = ParseDecimalByte(fields[3], kMaxRefDigits);
    if (!cfg.has_value() || !intf.has_value()) {
      return {};
    }
    interface_ref = InterfaceRef{*cfg, *intf};
  }

  if (fields[0].size() == kIdDigits && fields[1].size() == kIdDigits) {
    auto vid = ParseNumber(fields[0], 16);
    auto pid = ParseNumber(fields[1], 16);
    if (!vid.has_value() || !pid.has_value()) {
      return {};
    }
    return VendorProduct(static_cast<uint16_t>(*vid), static_cast<uint16_t>(*pid), interface_ref);
  }

  if (fields[0].size() == kBusAddressDigits && fields[1].size() == kBusAddressDigits) {
    auto bus = ParseDecimalByte(fields[0], kBusAddressDigits);
    auto address = ParseDecimalByte(fields[1], kBusAddressDigits);
    if (!bus.has_value() || !address.has_value()) {
      return {};
    }
    return BusAddress(*bus, *address, interface_ref);
  }

  return {};
}

std::string DeviceSpecifier::ToString() const {
  std::string base;
  switch (kind_) {
    case SpecifierKind::kAuto:
      return "auto";
    case SpecifierKind::kPath:
      return path_;
    case SpecifierKind::kVendorProduct:
      base = fmt::format("{:04x}:{:04x}", vendor_id_, product_id_);
      break;
    case SpecifierKind::kBusAddress:
      base = fmt::format("{:03d}:{:03d}", bus_, address_);
      break;
  }
  if (interface_ref_.has_value()) {
    base += fmt::format(":{}:{}", interface_ref_->configuration_value, interface_ref_->interface_number);
  }
  return base;
}

}  // namespace diaglink
