#pragma once

#include "../common/session_options.hpp"
#include "../transport/transport_factory.hpp"
#include "device_selector.hpp"

namespace diaglink {

/**
 * @brief Build the transport for a resolved device
 *
 * A chardev result opens a SerialTransport, a USB interface result a
 * UsbBulkTransport. A not-found result yields OpenError::kNotResolved.
 */
[[nodiscard]] OpenResult OpenTransport(const ResolvedDevice &device, const SerialOptions &serial_options = {},
                                       const UsbOptions &usb_options = {});

}  // namespace diaglink
