#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace diaglink {

/**
 * @brief Replays a raw capture of DIAG HDLC traffic from a file
 *
 * The file holds frames exactly as read from the device. Reads return the
 * file contents in order and report -1 at end of file, which ends the
 * session. Writes are accepted and discarded: a capture cannot answer.
 */
class ReplayTransport : public ByteTransport {
 public:
  explicit ReplayTransport(std::string path);
  ~ReplayTransport() override { Dispose(); }

  ReplayTransport(const ReplayTransport &) = delete;
  ReplayTransport &operator=(const ReplayTransport &) = delete;

  [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }
  [[nodiscard]] int GetOpenErrno() const { return open_errno_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override { return AvailableBytes() > 0; }
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override { return fd_ >= 0; }

  void Dispose() override;

 private:
  std::string path_;
  int fd_{-1};
  int open_errno_{0};
};

}  // namespace diaglink
