#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "diag_link/usb/device_selector.hpp"
#include "diag_link/usb/device_specifier.hpp"
#include "diag_link/usb/usb_interface_info.hpp"

using diaglink::DeviceSelector;
using diaglink::DeviceSpecifier;
using diaglink::InterfaceRef;
using diaglink::NotFoundReason;
using diaglink::RemediationHint;
using diaglink::ResolvedKind;
using diaglink::UsbEnumerator;
using diaglink::UsbInterfaceInfo;

namespace {

class FakeEnumerator : public UsbEnumerator {
 public:
  std::vector<UsbInterfaceInfo> Enumerate() override {
    ++calls;
    return interfaces;
  }

  std::vector<UsbInterfaceInfo> interfaces;
  int calls{0};
};

UsbInterfaceInfo MakeInterface(uint8_t bus, uint8_t address, uint8_t interface_number, uint8_t cls, uint8_t subclass,
                               uint8_t protocol, uint8_t endpoints = 2) {
  UsbInterfaceInfo info;
  info.bus = bus;
  info.address = address;
  info.port_path = {1};
  info.vendor_id = 0x05C6;
  info.product_id = 0x9091;
  info.configuration_value = 1;
  info.interface_number = interface_number;
  info.interface_class = cls;
  info.interface_subclass = subclass;
  info.interface_protocol = protocol;
  info.num_endpoints = endpoints;
  info.bulk_in_endpoint = 0x81;
  info.bulk_out_endpoint = 0x01;
  return info;
}

class DeviceSelectorTest : public ::testing::Test {
 protected:
  FakeEnumerator enumerator_;
  DeviceSelector selector_{enumerator_};
};

}  // namespace

TEST_F(DeviceSelectorTest, PathSkipsEnumeration) {
  auto resolved = selector_.Resolve(DeviceSpecifier::Path("/dev/ttyUSB0"));
  EXPECT_EQ(resolved.GetKind(), ResolvedKind::kChardev);
  EXPECT_EQ(resolved.GetChardevPath(), std::optional<std::string>("/dev/ttyUSB0"));
  EXPECT_EQ(enumerator_.calls, 0);
}

TEST_F(DeviceSelectorTest, AutoPrefersPrimaryRule) {
  enumerator_.interfaces = {
      MakeInterface(1, 3, 0, 0xFF, 0xFF, 0xFF),
      MakeInterface(1, 3, 1, 0xFF, 0x42, 0x01),
      MakeInterface(1, 3, 2, 0xFF, 0xFF, 0x30),
  };

  auto resolved = selector_.Resolve(DeviceSpecifier::Auto());
  ASSERT_EQ(resolved.GetKind(), ResolvedKind::kUsbInterface);
  EXPECT_EQ(resolved.GetInterface()->interface_number, 2);
  EXPECT_EQ(enumerator_.calls, 1);
}

TEST_F(DeviceSelectorTest, AutoFallsBackToVendorSpecificRule) {
  enumerator_.interfaces = {
      MakeInterface(1, 3, 0, 0xFF, 0xFF, 0xFF, 3),
      MakeInterface(1, 3, 1, 0x02, 0x02, 0x01),
      MakeInterface(1, 3, 4, 0xFF, 0xFF, 0xFF),
  };

  auto resolved = selector_.Resolve(DeviceSpecifier::Auto());
  ASSERT_TRUE(resolved.IsFound());
  EXPECT_EQ(resolved.GetInterface()->interface_number, 4);
}

TEST_F(DeviceSelectorTest, AutoWithoutCandidates) {
  enumerator_.interfaces = {MakeInterface(1, 3, 0, 0x08, 0x06, 0x50)};
  auto resolved = selector_.Resolve(DeviceSpecifier::Auto());
  EXPECT_FALSE(resolved.IsFound());
  EXPECT_EQ(resolved.GetNotFoundReason(), NotFoundReason::kNoMatchingInterface);
}

TEST_F(DeviceSelectorTest, ChardevTakesPrecedence) {
  auto info = MakeInterface(1, 3, 2, 0xFF, 0xFF, 0x30);
  info.kernel_driver_active = true;
  info.chardev_path = "/dev/ttyUSB1";
  enumerator_.interfaces = {info};

  auto resolved = selector_.Resolve(DeviceSpecifier::Auto());
  EXPECT_EQ(resolved.GetKind(), ResolvedKind::kChardev);
  EXPECT_EQ(*resolved.GetChardevPath(), "/dev/ttyUSB1");
}

TEST_F(DeviceSelectorTest, ChardevPreferredOverClaimableInterface) {
  auto info = MakeInterface(1, 3, 0, 0xFF, 0xFF, 0x30);
  info.chardev_path = "/dev/ttyHS0";
  enumerator_.interfaces = {info};

  auto resolved = selector_.Resolve(DeviceSpecifier::VendorProduct(0x05C6, 0x9091, InterfaceRef{1, 0}));
  EXPECT_EQ(resolved.GetKind(), ResolvedKind::kChardev);
  EXPECT_FALSE(resolved.GetInterface().has_value());
  EXPECT_EQ(*resolved.GetChardevPath(), "/dev/ttyHS0");
}

TEST_F(DeviceSelectorTest, KernelDriverWithoutChardev) {
  auto info = MakeInterface(1, 3, 2, 0xFF, 0xFF, 0x30);
  info.kernel_driver_active = true;
  enumerator_.interfaces = {info};

  auto resolved = selector_.Resolve(DeviceSpecifier::Auto());
  EXPECT_FALSE(resolved.IsFound());
  EXPECT_EQ(resolved.GetNotFoundReason(), NotFoundReason::kKernelDriverActiveNoChardev);
  EXPECT_NE(std::string(RemediationHint(*resolved.GetNotFoundReason())).find("/dev/ttyUSB2"), std::string::npos);
}

TEST_F(DeviceSelectorTest, ExplicitInterfaceIsUsedAsIs) {
  enumerator_.interfaces = {
      MakeInterface(1, 3, 0, 0xFF, 0xFF, 0x30),
      MakeInterface(1, 3, 5, 0x0A, 0x00, 0x00),
  };

  auto resolved = selector_.Resolve(DeviceSpecifier::VendorProduct(0x05C6, 0x9091, InterfaceRef{1, 5}));
  ASSERT_EQ(resolved.GetKind(), ResolvedKind::kUsbInterface);
  EXPECT_EQ(resolved.GetInterface()->interface_number, 5);
}

TEST_F(DeviceSelectorTest, ExplicitInterfaceMissing) {
  enumerator_.interfaces = {MakeInterface(1, 3, 0, 0xFF, 0xFF, 0x30)};
  auto resolved = selector_.Resolve(DeviceSpecifier::BusAddress(1, 3, InterfaceRef{1, 7}));
  EXPECT_EQ(resolved.GetNotFoundReason(), NotFoundReason::kNoMatchingInterface);
}

TEST_F(DeviceSelectorTest, ExplicitDeviceAbsent) {
  enumerator_.interfaces = {MakeInterface(1, 3, 0, 0xFF, 0xFF, 0x30)};
  auto resolved = selector_.Resolve(DeviceSpecifier::BusAddress(2, 9));
  EXPECT_EQ(resolved.GetNotFoundReason(), NotFoundReason::kExplicitTargetAbsent);

  resolved = selector_.Resolve(DeviceSpecifier::VendorProduct(0x1234, 0x5678));
  EXPECT_EQ(resolved.GetNotFoundReason(), NotFoundReason::kExplicitTargetAbsent);
}

TEST_F(DeviceSelectorTest, VendorProductOnTwoDevicesIsAmbiguous) {
  enumerator_.interfaces = {
      MakeInterface(1, 3, 0, 0xFF, 0xFF, 0x30),
      MakeInterface(1, 4, 0, 0xFF, 0xFF, 0x30),
  };

  auto resolved = selector_.Resolve(DeviceSpecifier::VendorProduct(0x05C6, 0x9091));
  EXPECT_EQ(resolved.GetNotFoundReason(), NotFoundReason::kAmbiguous);

  resolved = selector_.Resolve(DeviceSpecifier::BusAddress(1, 4));
  ASSERT_TRUE(resolved.IsFound());
  EXPECT_EQ(resolved.GetInterface()->address, 4);
}

TEST_F(DeviceSelectorTest, ExplicitDeviceMatchedByRule) {
  enumerator_.interfaces = {
      MakeInterface(1, 3, 0, 0xFF, 0xFF, 0x30),
      MakeInterface(2, 8, 0, 0x02, 0x02, 0x01),
      MakeInterface(2, 8, 3, 0xFF, 0xFF, 0xFF),
  };

  auto resolved = selector_.Resolve(DeviceSpecifier::BusAddress(2, 8));
  ASSERT_TRUE(resolved.IsFound());
  EXPECT_EQ(resolved.GetInterface()->bus, 2);
  EXPECT_EQ(resolved.GetInterface()->interface_number, 3);
}

TEST(DeviceSelector, MatchInterfaceOnEmptyList) {
  std::vector<UsbInterfaceInfo> none;
  EXPECT_FALSE(DeviceSelector::MatchInterface(none).has_value());
}
