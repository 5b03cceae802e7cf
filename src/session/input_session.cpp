#include "session/input_session.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/logger.hpp"
#include "hdlc/diag_packet.hpp"
#include "hdlc/hdlc_frame.hpp"

namespace diaglink {

const char *SessionExitToString(SessionExit exit) {
  switch (exit) {
    case SessionExit::kStopped:
      return "stopped";
    case SessionExit::kTransportUnavailable:
      return "transport unavailable";
    case SessionExit::kReadFailed:
      return "read failed";
  }
  return "unknown";
}

InputSession::InputSession(std::unique_ptr<ByteTransport> transport, SessionOptions options)
    : transport_(std::move(transport)),
      options_(options),
      read_buffer_(std::max<size_t>(options.read_chunk_size, 1)) {}

InputSession::~InputSession() {
  Shutdown();
}

DiagModule &InputSession::AddModule(std::unique_ptr<DiagModule> module) {
  modules_.push_back(std::move(module));
  return *modules_.back();
}

FrameOutcome InputSession::ReadFrame(std::vector<uint8_t> &frame) {
  if (transport_ == nullptr) {
    return FrameOutcome::kReadFailed;
  }
  size_t scanned = 0;
  while (true) {
    if (IsStopRequested() || IsShutDown()) {
      return FrameOutcome::kStopped;
    }

    auto trailer = std::find(pending_.begin() + static_cast<std::ptrdiff_t>(scanned), pending_.end(),
                             HdlcFrame::kTrailer);
    if (trailer != pending_.end()) {
      // Bytes after the trailer belong to the next frame and stay buffered
      frame.assign(pending_.begin(), trailer + 1);
      pending_.erase(pending_.begin(), trailer + 1);
      return FrameOutcome::kDispatched;
    }
    scanned = pending_.size();

    if (pending_.size() > options_.max_frame_size) {
      DIAGLINK_LOG_WARN("Dropped {} bytes received without a frame trailer", pending_.size());
      pending_.clear();
      ++frames_skipped_;
      return FrameOutcome::kSkipped;
    }

    bool was_empty = pending_.empty();
    int n = transport_->Read(read_buffer_);
    if (n < 0) {
      return FrameOutcome::kReadFailed;
    }
    // A read made of nothing but the trailer: the modem has gone away
    if (was_empty && n == 1 && read_buffer_[0] == HdlcFrame::kTrailer) {
      return FrameOutcome::kTransportUnavailable;
    }
    pending_.insert(pending_.end(), read_buffer_.begin(), read_buffer_.begin() + n);
  }
}

FrameOutcome InputSession::ProcessNextFrame() {
  std::vector<uint8_t> frame;
  FrameOutcome read_outcome = ReadFrame(frame);
  if (read_outcome == FrameOutcome::kTransportUnavailable) {
    DIAGLINK_LOG_ERROR("The modem seems to be unavailable.");
  }
  if (read_outcome != FrameOutcome::kDispatched) {
    return read_outcome;
  }

  if (frame.size() == 1) {
    // Idle flag or back-to-back trailers
    ++frames_skipped_;
    return FrameOutcome::kSkipped;
  }

  bool strict = GetState() == SessionState::kAwaitingFirstFrame;
  FrameError error = FrameError::kNone;
  auto packet = HdlcFrame::Decode(frame, strict, &error);
  state_.store(SessionState::kStreaming, std::memory_order_release);

  if (!packet.has_value()) {
    ++frames_skipped_;
    if (strict) {
      DIAGLINK_LOG_DEBUG("Discarded partial first frame ({} bytes, {})", frame.size(), FrameErrorToString(error));
    } else {
      DIAGLINK_LOG_DEBUG("Dropped frame with no content ({})", FrameErrorToString(error));
    }
    return FrameOutcome::kSkipped;
  }

  if (error != FrameError::kNone) {
    ++frames_degraded_;
    DIAGLINK_LOG_DEBUG("Dispatching degraded frame of type 0x{:02x} ({})", packet->GetTypeId(),
                       FrameErrorToString(error));
  }

  Dispatch(*packet);
  return FrameOutcome::kDispatched;
}

void InputSession::Dispatch(const DiagPacket &packet) {
  if (options_.log_packets) {
    DIAGLINK_LOG_DEBUG("[<] DIAG packet 0x{:02x}: {}", packet.GetTypeId(), BytesToHex(packet.GetPayload()));
  }
  ++frames_dispatched_;
  for (auto &module : modules_) {
    module->OnPacket(packet);
  }
}

SessionExit InputSession::Run() {
  // Shutdown() runs on every way out, including a module throwing
  struct ShutdownGuard {
    InputSession &session;
    ~ShutdownGuard() { session.Shutdown(); }
  } guard{*this};

  while (true) {
    switch (ProcessNextFrame()) {
      case FrameOutcome::kDispatched:
      case FrameOutcome::kSkipped:
        continue;
      case FrameOutcome::kStopped:
        DIAGLINK_LOG_DEBUG("Read loop stopped on request");
        return SessionExit::kStopped;
      case FrameOutcome::kTransportUnavailable:
        return SessionExit::kTransportUnavailable;
      case FrameOutcome::kReadFailed:
        DIAGLINK_LOG_ERROR("Reading from the device failed; it may have been unplugged or access was revoked.");
        return SessionExit::kReadFailed;
    }
  }
}

bool InputSession::SendRequest(uint8_t type_id, std::span<const uint8_t> payload) {
  std::vector<uint8_t> frame = HdlcFrame::Encode(type_id, payload);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (IsShutDown() || transport_ == nullptr) {
    ++write_failures_;
    DIAGLINK_LOG_WARN("Dropped DIAG request 0x{:02x}: the session is shut down", type_id);
    return false;
  }

  int written = transport_->Write(frame);
  if (written != static_cast<int>(frame.size()) || !transport_->Flush()) {
    ++write_failures_;
    DIAGLINK_LOG_WARN(
        "Can't write to the device. Maybe you need root/administrator privileges, or the device was unplugged?");
    return false;
  }

  if (options_.log_packets) {
    DIAGLINK_LOG_DEBUG("[>] DIAG packet 0x{:02x}: {}", type_id, BytesToHex(payload));
  }
  return true;
}

void InputSession::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    if (transport_ != nullptr) {
      transport_->Dispose();
    }
  }

  // Outside the lock: a module may still try to send from OnShutdown()
  for (auto it = modules_.rbegin(); it != modules_.rend(); ++it) {
    (*it)->OnShutdown();
  }
}

SessionStats InputSession::GetStats() const {
  SessionStats stats;
  stats.frames_dispatched = frames_dispatched_.load();
  stats.frames_skipped = frames_skipped_.load();
  stats.frames_degraded = frames_degraded_.load();
  stats.write_failures = write_failures_.load();
  return stats;
}

}  // namespace diaglink
