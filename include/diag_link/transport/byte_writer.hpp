#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "byte_reader.hpp"

namespace diaglink {

/**
 * @brief Abstract interface for writing bytes to a transport layer
 */
class ByteWriter {
 public:
  virtual ~ByteWriter() = default;

  /**
   * @brief Write a whole buffer, blocking until the device accepted it
   * @return data.size() on success, -1 if the device refused or went away
   */
  [[nodiscard]] virtual int Write(std::span<const uint8_t> data) = 0;

  /**
   * @brief Push buffered bytes out to the device
   */
  [[nodiscard]] virtual bool Flush() = 0;
};

/**
 * @brief Combined interface for bidirectional byte I/O
 *
 * Write() may be called from one thread while Read() blocks in another.
 */
class ByteTransport : public ByteReader, public ByteWriter {
 public:
  ~ByteTransport() override = default;

  /**
   * @brief Release the underlying OS/device resources
   *
   * Idempotent; safe on a transport whose construction failed half-way.
   * Read() and Write() return -1 afterwards.
   */
  virtual void Dispose() = 0;
};

}  // namespace diaglink
