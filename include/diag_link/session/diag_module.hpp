#pragma once

#include <cstdint>
#include <span>
#include "../hdlc/diag_packet.hpp"

namespace diaglink {

/**
 * @brief Outbound path offered to modules
 */
class DiagSender {
 public:
  virtual ~DiagSender() = default;

  /**
   * @brief Frame and send one DIAG request
   * @return true if the whole frame was written
   */
  [[nodiscard]] virtual bool SendRequest(uint8_t type_id, std::span<const uint8_t> payload) = 0;
};

/**
 * @brief Consumer of decoded DIAG packets
 *
 * OnPacket() is called on the session's reader thread, once per dispatched
 * frame, in arrival order. A module may send requests from any thread,
 * including from inside OnPacket().
 */
class DiagModule {
 public:
  virtual ~DiagModule() = default;

  virtual void OnPacket(const DiagPacket &packet) = 0;

  /**
   * @brief Called once when the session shuts down, after the transport is released
   */
  virtual void OnShutdown() {}
};

}  // namespace diaglink
