#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace diaglink {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

static inline constexpr uint16_t MakeUint16(uint8_t low_byte, uint8_t high_byte) {
  return static_cast<uint16_t>(static_cast<uint16_t>(high_byte) << kBitsPerByte | static_cast<uint16_t>(low_byte));
}

/**
 * @brief Convert binary bytes to a lowercase hex string (e.g., {0x4B, 0x12} -> "4b12")
 */
[[nodiscard]] inline std::string BytesToHex(std::span<const uint8_t> bytes) {
  static constexpr char kHexChars[] = "0123456789abcdef";
  std::string result;
  result.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    result += kHexChars[(b >> 4) & 0x0F];
    result += kHexChars[b & 0x0F];
  }
  return result;
}

}  // namespace diaglink
