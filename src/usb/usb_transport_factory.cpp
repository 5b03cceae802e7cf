#include "usb/usb_transport_factory.hpp"
#include <memory>
#include <utility>
#include "common/logger.hpp"
#include "usb/device_selector.hpp"
#include "usb/usb_bulk_transport.hpp"

namespace diaglink {

OpenResult OpenTransport(const ResolvedDevice &device, const SerialOptions &serial_options,
                         const UsbOptions &usb_options) {
  switch (device.GetKind()) {
    case ResolvedKind::kChardev:
      return OpenChardevTransport(*device.GetChardevPath(), serial_options);
    case ResolvedKind::kUsbInterface: {
      auto transport = std::make_unique<UsbBulkTransport>(*device.GetInterface(), usb_options);
      if (!transport->IsOpen()) {
        return {nullptr, transport->GetOpenError()};
      }
      return {std::move(transport), OpenError::kNone};
    }
    case ResolvedKind::kNotFound:
      break;
  }
  return {nullptr, OpenError::kNotResolved};
}

}  // namespace diaglink
