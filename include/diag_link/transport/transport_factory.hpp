#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "../common/session_options.hpp"
#include "byte_writer.hpp"

namespace diaglink {

/**
 * @brief Why a transport could not be constructed
 */
enum class OpenError : uint8_t {
  kNone = 0,
  kNotResolved,           ///< The device specifier resolved to nothing
  kKernelDriverConflict,  ///< A kernel driver owns the USB interface
  kPermissionDenied,
  kDeviceVanished,  ///< Device disappeared between resolution and open
  kOpenFailed,
};

[[nodiscard]] const char *OpenErrorToString(OpenError error);

/**
 * @brief Operator-facing advice for a construction failure
 */
[[nodiscard]] const char *OpenErrorHint(OpenError error);

/**
 * @brief Map an errno from open(2)/connect(2) to an OpenError
 */
[[nodiscard]] OpenError OpenErrorFromErrno(int err);

/**
 * @brief A live transport, or the reason there is none
 */
struct OpenResult {
  std::unique_ptr<ByteTransport> transport{};
  OpenError error{OpenError::kNone};

  [[nodiscard]] bool Ok() const noexcept { return transport != nullptr; }
};

/**
 * @brief Open a tty/character device transport
 */
[[nodiscard]] OpenResult OpenChardevTransport(const std::string &path, const SerialOptions &options = {});

/**
 * @brief Connect to a forwarded DIAG bridge
 */
[[nodiscard]] OpenResult OpenTcpTransport(const TcpOptions &options = {});

/**
 * @brief Open a raw capture file for replay
 */
[[nodiscard]] OpenResult OpenReplayTransport(const std::string &path);

}  // namespace diaglink
