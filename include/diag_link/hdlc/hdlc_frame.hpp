#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "diag_packet.hpp"

namespace diaglink {

/**
 * @brief Reason a received frame failed validation
 */
enum class FrameError : uint8_t {
  kNone = 0,
  kMissingTrailer,   ///< Last byte is not the trailer
  kEmbeddedTrailer,  ///< Unescaped trailer before the last byte
  kBadEscape,        ///< Escape byte followed by something other than an escaped trailer/escape
  kDanglingEscape,   ///< Escape byte immediately before the trailer
  kTooShort,         ///< Less than type id + CRC after unescaping
  kCrcMismatch,
};

[[nodiscard]] const char *FrameErrorToString(FrameError error);

/**
 * @brief DIAG HDLC-like frame encoder/decoder
 *
 * Frame layout before escaping: [type_id][payload...][crc16 lo][crc16 hi].
 * Every trailer (0x7E) or escape (0x7D) byte in that body is sent as
 * 0x7D followed by the byte XOR 0x20, and the frame is closed by one
 * unescaped 0x7E. There is no leading flag.
 *
 * Stateless; safe to call from any thread.
 */
class HdlcFrame {
 public:
  static constexpr uint8_t kTrailer = 0x7E;
  static constexpr uint8_t kEscape = 0x7D;
  static constexpr uint8_t kEscapeMask = 0x20;

  /**
   * @brief Encode a packet into a complete frame
   * @param type_id DIAG command/type code
   * @param payload Packet payload (any bytes, any length)
   * @return Escaped body with CRC, terminated by the trailer byte
   */
  [[nodiscard]] static std::vector<uint8_t> Encode(uint8_t type_id, std::span<const uint8_t> payload);

  [[nodiscard]] static std::vector<uint8_t> Encode(const DiagPacket &packet) {
    return Encode(packet.GetTypeId(), packet.GetPayload());
  }

  /**
   * @brief Decode a frame ending with the trailer byte
   *
   * Validation runs in both modes and its result is stored in @p error when
   * given. In strict mode any failure yields an empty optional. In lenient
   * mode a best-effort packet is built from whatever could be unescaped;
   * only an empty body yields an empty optional.
   *
   * @param frame Raw bytes up to and including the trailer
   * @param strict Reject malformed frames instead of salvaging them
   * @param error Optional out-parameter receiving the first validation failure
   */
  [[nodiscard]] static std::optional<DiagPacket> Decode(std::span<const uint8_t> frame, bool strict,
                                                        FrameError *error = nullptr);

  /**
   * @brief Escape trailer/escape bytes of an unframed body (no trailer appended)
   */
  [[nodiscard]] static std::vector<uint8_t> Escape(std::span<const uint8_t> body);

  /**
   * @brief Reverse Escape() over bytes that do not include the trailer
   * @param first_error Receives the first escape problem found, kNone if none
   */
  [[nodiscard]] static std::vector<uint8_t> Unescape(std::span<const uint8_t> escaped, FrameError *first_error);

 private:
  static constexpr size_t kCrcSize = 2;
  static constexpr size_t kMinBodySize = 1 + kCrcSize;  // type_id + CRC
};

}  // namespace diaglink
