#include "transport/transport_factory.hpp"
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include "common/logger.hpp"
#include "transport/replay_transport.hpp"
#include "transport/serial_transport.hpp"
#include "transport/tcp_transport.hpp"

namespace diaglink {

const char *OpenErrorToString(OpenError error) {
  switch (error) {
    case OpenError::kNone:
      return "none";
    case OpenError::kNotResolved:
      return "device not resolved";
    case OpenError::kKernelDriverConflict:
      return "interface claimed by a kernel driver";
    case OpenError::kPermissionDenied:
      return "permission denied";
    case OpenError::kDeviceVanished:
      return "device vanished";
    case OpenError::kOpenFailed:
      return "open failed";
  }
  return "unknown";
}

const char *OpenErrorHint(OpenError error) {
  switch (error) {
    case OpenError::kNone:
      return "";
    case OpenError::kNotResolved:
      return "No usable device was resolved from the specifier.";
    case OpenError::kKernelDriverConflict:
      return "The USB modem device seems to be taken by a kernel driver, such as \"usbserial\" or \"hso\". "
             "Please pass directly a device name like \"/dev/ttyUSB2\" or \"/dev/ttyHS0\", or unload the "
             "corresponding driver.";
    case OpenError::kPermissionDenied:
      return "Access to the device was refused. You may need root privileges or a udev rule granting access.";
    case OpenError::kDeviceVanished:
      return "The device disappeared before it could be opened. Was it unplugged or did it reset?";
    case OpenError::kOpenFailed:
      return "The device could not be opened.";
  }
  return "";
}

OpenError OpenErrorFromErrno(int err) {
  switch (err) {
    case EACCES:
    case EPERM:
      return OpenError::kPermissionDenied;
    case ENOENT:
    case ENODEV:
    case ENXIO:
      return OpenError::kDeviceVanished;
    default:
      return OpenError::kOpenFailed;
  }
}

OpenResult OpenChardevTransport(const std::string &path, const SerialOptions &options) {
  auto transport = std::make_unique<SerialTransport>(path, options);
  if (!transport->IsOpen()) {
    DIAGLINK_LOG_DEBUG("Cannot open {}: {}", path, std::strerror(transport->GetOpenErrno()));
    return {nullptr, OpenErrorFromErrno(transport->GetOpenErrno())};
  }
  return {std::move(transport), OpenError::kNone};
}

OpenResult OpenTcpTransport(const TcpOptions &options) {
  auto transport = std::make_unique<TcpTransport>(options);
  if (!transport->IsOpen()) {
    DIAGLINK_LOG_DEBUG("Cannot connect to {}:{}: {}", options.host, options.port,
                       std::strerror(transport->GetOpenErrno()));
    return {nullptr, OpenErrorFromErrno(transport->GetOpenErrno())};
  }
  return {std::move(transport), OpenError::kNone};
}

OpenResult OpenReplayTransport(const std::string &path) {
  auto transport = std::make_unique<ReplayTransport>(path);
  if (!transport->IsOpen()) {
    DIAGLINK_LOG_DEBUG("Cannot open capture {}: {}", path, std::strerror(transport->GetOpenErrno()));
    return {nullptr, OpenErrorFromErrno(transport->GetOpenErrno())};
  }
  return {std::move(transport), OpenError::kNone};
}

}  // namespace diaglink
