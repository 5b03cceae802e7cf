#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace diaglink {

/**
 * @brief Memory-based transport implementation for testing and simple use cases
 *
 * Read data is scripted as a sequence of chunks: one Read() never crosses a
 * chunk boundary, which mimics how USB and serial stacks hand over data. Once
 * every chunk is consumed, Read() returns 0 (idle) or -1 (disconnected) as
 * configured. Written bytes are recorded.
 */
class MemoryTransport : public ByteTransport {
 public:
  static constexpr size_t kDefaultInitialCapacity = 256;
  explicit MemoryTransport(size_t initial_capacity = kDefaultInitialCapacity) {
    write_buffer_.reserve(initial_capacity);
  }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
      return -1;
    }
    while (chunk_index_ < chunks_.size() && chunk_pos_ >= chunks_[chunk_index_].size()) {
      ++chunk_index_;
      chunk_pos_ = 0;
    }
    if (chunk_index_ >= chunks_.size()) {
      return disconnect_when_drained_ ? -1 : 0;
    }

    const auto &chunk = chunks_[chunk_index_];
    size_t bytes_to_read = std::min(buffer.size(), chunk.size() - chunk_pos_);
    std::copy_n(chunk.begin() + static_cast<std::ptrdiff_t>(chunk_pos_), bytes_to_read, buffer.begin());
    chunk_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] bool HasData() const override { return AvailableBytes() > 0; }

  [[nodiscard]] size_t AvailableBytes() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t available = 0;
    for (size_t i = chunk_index_; i < chunks_.size(); ++i) {
      available += chunks_[i].size();
    }
    if (chunk_index_ < chunks_.size()) {
      available -= chunk_pos_;
    }
    return available;
  }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || fail_writes_) {
      return -1;
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return true; }

  void Dispose() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!disposed_) {
      disposed_ = true;
      ++release_count_;
    }
  }

  // MemoryTransport-specific methods
  /**
   * @brief Replace the scripted read data with a single chunk
   */
  void SetReadData(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
    chunks_.emplace_back(data.begin(), data.end());
    chunk_index_ = 0;
    chunk_pos_ = 0;
  }

  /**
   * @brief Append one chunk to the scripted read data
   */
  void AddReadChunk(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.emplace_back(data.begin(), data.end());
  }

  /**
   * @brief Report a disconnect (-1) instead of idling (0) once all chunks are read
   */
  void SetDisconnectWhenDrained(bool disconnect) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_when_drained_ = disconnect;
  }

  /**
   * @brief Make every following Write() fail, as an unplugged device would
   */
  void SetFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
  }

  /**
   * @brief Get a copy of the data that was written via Write()
   */
  [[nodiscard]] std::vector<uint8_t> GetWrittenData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_buffer_;
  }

  void ClearWriteBuffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    write_buffer_.clear();
  }

  /**
   * @brief Reset read position to the first chunk
   */
  void ResetReadPosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunk_index_ = 0;
    chunk_pos_ = 0;
  }

  [[nodiscard]] bool IsDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
  }

  /**
   * @brief Number of times resources were actually released (0 or 1)
   */
  [[nodiscard]] int GetReleaseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return release_count_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::vector<uint8_t>> chunks_;
  size_t chunk_index_{0};
  size_t chunk_pos_{0};
  std::vector<uint8_t> write_buffer_;
  bool disconnect_when_drained_{false};
  bool fail_writes_{false};
  bool disposed_{false};
  int release_count_{0};
};

}  // namespace diaglink
