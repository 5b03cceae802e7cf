#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace diaglink {

/**
 * @brief Abstract interface for reading bytes from a transport layer
 *
 * Lets the session read DIAG traffic from any byte source (USB bulk endpoint,
 * serial device, TCP bridge, capture file, memory buffer) without knowing the
 * details.
 */
class ByteReader {
 public:
  virtual ~ByteReader() = default;

  /**
   * @brief Read bytes from the transport layer
   *
   * Blocks for at most the transport's poll interval.
   *
   * @param buffer Buffer to store read bytes; its size is the maximum to read
   * @return Number of bytes read, 0 if nothing arrived within the poll interval,
   *         -1 on disconnect, permission loss or end of stream
   */
  [[nodiscard]] virtual int Read(std::span<uint8_t> buffer) = 0;

  /**
   * @brief Whether a Read() issued now would return data without waiting
   */
  [[nodiscard]] virtual bool HasData() const = 0;

  /**
   * @brief Bytes already queued by the OS or device, 0 when unknown
   */
  [[nodiscard]] virtual size_t AvailableBytes() const = 0;
};

}  // namespace diaglink
