#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace diaglink {

/**
 * @brief A decoded DIAG packet: one-byte command/type code plus opaque payload
 */
class DiagPacket {
 public:
  DiagPacket() = default;
  DiagPacket(uint8_t type_id, std::vector<uint8_t> payload)
      : type_id_(type_id),
        payload_(std::move(payload)) {}

  [[nodiscard]] uint8_t GetTypeId() const noexcept { return type_id_; }
  [[nodiscard]] std::span<const uint8_t> GetPayload() const noexcept { return {payload_.data(), payload_.size()}; }

  bool operator==(const DiagPacket &other) const = default;

 private:
  uint8_t type_id_{0};
  std::vector<uint8_t> payload_{};
};

}  // namespace diaglink
