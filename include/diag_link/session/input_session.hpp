#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>
#include "../common/session_options.hpp"
#include "../hdlc/diag_packet.hpp"
#include "../transport/byte_writer.hpp"
#include "diag_module.hpp"

namespace diaglink {

enum class SessionState : uint8_t {
  /** Nothing decoded yet; the first frame may be the tail of one already in flight. */
  kAwaitingFirstFrame,
  /** Stream is in sync; malformed frames are salvaged, never rejected. */
  kStreaming,
};

/**
 * @brief Result of one ProcessNextFrame() call
 */
enum class FrameOutcome : uint8_t {
  kDispatched,
  kSkipped,
  kStopped,
  kTransportUnavailable,
  kReadFailed,
};

/**
 * @brief Why Run() returned
 */
enum class SessionExit : uint8_t {
  kStopped,
  kTransportUnavailable,
  kReadFailed,
};

[[nodiscard]] const char *SessionExitToString(SessionExit exit);

struct SessionStats {
  uint64_t frames_dispatched{0};
  uint64_t frames_skipped{0};
  /** Frames dispatched from a lenient decode that reported a validation error. */
  uint64_t frames_degraded{0};
  uint64_t write_failures{0};
};

/**
 * @brief Owns a transport and the registered modules and runs the read/dispatch loop
 *
 * Reads are accumulated until a trailer byte arrives; each complete frame is
 * decoded and handed to every module in registration order. The very first
 * frame is decoded strictly and silently dropped if malformed; every later
 * frame is decoded leniently.
 *
 * Threading: ProcessNextFrame()/Run() belong to one reader thread.
 * SendRequest() and RequestStop() may be called from any thread.
 */
class InputSession : public DiagSender {
 public:
  explicit InputSession(std::unique_ptr<ByteTransport> transport, SessionOptions options = {});
  ~InputSession() override;

  InputSession(const InputSession &) = delete;
  InputSession &operator=(const InputSession &) = delete;

  /**
   * @brief Register a module; call before the loop starts
   * @return Reference to the registered module
   */
  DiagModule &AddModule(std::unique_ptr<DiagModule> module);

  [[nodiscard]] size_t GetModuleCount() const noexcept { return modules_.size(); }

  /**
   * @brief Read, decode and dispatch one frame
   *
   * Blocks until a complete frame is buffered, the transport fails, or a
   * stop is requested.
   */
  FrameOutcome ProcessNextFrame();

  /**
   * @brief Process frames until a terminal outcome, then Shutdown()
   */
  SessionExit Run();

  /**
   * @brief Ask the loop to stop at its next accumulation step
   */
  void RequestStop() noexcept { stop_requested_.store(true, std::memory_order_release); }
  [[nodiscard]] bool IsStopRequested() const noexcept { return stop_requested_.load(std::memory_order_acquire); }

  [[nodiscard]] bool SendRequest(uint8_t type_id, std::span<const uint8_t> payload) override;

  /**
   * @brief Release the transport, then notify modules in reverse registration order
   *
   * Idempotent. Must not race with a Read() in progress on another thread;
   * stop the loop with RequestStop() instead.
   */
  void Shutdown();

  [[nodiscard]] bool IsShutDown() const noexcept { return shut_down_.load(std::memory_order_acquire); }
  [[nodiscard]] SessionState GetState() const noexcept { return state_.load(std::memory_order_acquire); }
  [[nodiscard]] SessionStats GetStats() const;

 private:
  /**
   * @brief Move the next complete frame (up to and including its trailer) into @p frame
   * @return kDispatched when a frame is ready, kSkipped when bytes without a trailer
   *         overflowed max_frame_size, kTransportUnavailable when a read on an empty
   *         buffer delivered nothing but the trailer, otherwise the terminal outcome
   */
  FrameOutcome ReadFrame(std::vector<uint8_t> &frame);

  void Dispatch(const DiagPacket &packet);

  std::unique_ptr<ByteTransport> transport_;
  SessionOptions options_;
  std::vector<std::unique_ptr<DiagModule>> modules_;

  std::vector<uint8_t> pending_;  // bytes received but not yet framed
  std::vector<uint8_t> read_buffer_;

  std::atomic<SessionState> state_{SessionState::kAwaitingFirstFrame};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> shut_down_{false};
  std::mutex write_mutex_;

  std::atomic<uint64_t> frames_dispatched_{0};
  std::atomic<uint64_t> frames_skipped_{0};
  std::atomic<uint64_t> frames_degraded_{0};
  std::atomic<uint64_t> write_failures_{0};
};

}  // namespace diaglink
