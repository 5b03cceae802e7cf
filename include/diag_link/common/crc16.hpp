#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "byte_helpers.hpp"

namespace diaglink {

namespace detail {

// CRC-16/X.25 works LSB first, so the table holds the reflected polynomial
constexpr uint16_t kCrc16ReflectedPoly = 0x8408;

constexpr std::array<uint16_t, 256> MakeCrc16Table() {
  std::array<uint16_t, 256> table{};
  for (size_t n = 0; n < table.size(); ++n) {
    auto value = static_cast<uint16_t>(n);
    for (int bit = 0; bit < 8; ++bit) {
      value = (value & 1U) != 0 ? static_cast<uint16_t>((value >> 1) ^ kCrc16ReflectedPoly)
                                : static_cast<uint16_t>(value >> 1);
    }
    table[n] = value;
  }
  return table;
}

inline constexpr std::array<uint16_t, 256> kCrc16Table = MakeCrc16Table();

}  // namespace detail

/**
 * @brief CRC-16/X.25 as carried by DIAG HDLC frames
 *
 * Initial value 0xFFFF, final XOR 0xFFFF. Check value for "123456789" is 0x906E.
 *
 * @return CRC, sent on the wire low byte first
 */
[[nodiscard]] constexpr uint16_t CalculateCrc16(std::span<const uint8_t> data) {
  uint16_t crc = 0xFFFF;
  for (uint8_t byte : data) {
    crc = static_cast<uint16_t>((crc >> 8) ^ detail::kCrc16Table[(crc ^ byte) & 0xFF]);
  }
  return static_cast<uint16_t>(crc ^ 0xFFFF);
}

/**
 * @brief Append the CRC of everything already in @p body, low byte first
 */
inline void AppendCrc16(std::vector<uint8_t> &body) {
  uint16_t crc = CalculateCrc16(body);
  body.push_back(GetLowByte(crc));
  body.push_back(GetHighByte(crc));
}

/**
 * @brief Check an unescaped frame body whose last two bytes are its CRC
 */
[[nodiscard]] inline bool VerifyCrc16(std::span<const uint8_t> body) {
  if (body.size() < 2) {
    return false;
  }
  size_t data_size = body.size() - 2;
  return CalculateCrc16(body.first(data_size)) == MakeUint16(body[data_size], body[data_size + 1]);
}

}  // namespace diaglink
