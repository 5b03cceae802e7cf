#include "hdlc/hdlc_frame.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include "common/crc16.hpp"
#include "hdlc/diag_packet.hpp"

namespace diaglink {

const char *FrameErrorToString(FrameError error) {
  switch (error) {
    case FrameError::kNone:
      return "none";
    case FrameError::kMissingTrailer:
      return "missing trailer";
    case FrameError::kEmbeddedTrailer:
      return "unescaped trailer inside frame";
    case FrameError::kBadEscape:
      return "invalid escape sequence";
    case FrameError::kDanglingEscape:
      return "escape byte at end of frame";
    case FrameError::kTooShort:
      return "frame too short";
    case FrameError::kCrcMismatch:
      return "CRC mismatch";
  }
  return "unknown";
}

std::vector<uint8_t> HdlcFrame::Escape(std::span<const uint8_t> body) {
  std::vector<uint8_t> escaped;
  escaped.reserve(body.size() + body.size() / 8 + 1);
  for (uint8_t b : body) {
    if (b == kTrailer || b == kEscape) {
      escaped.push_back(kEscape);
      escaped.push_back(static_cast<uint8_t>(b ^ kEscapeMask));
    } else {
      escaped.push_back(b);
    }
  }
  return escaped;
}

std::vector<uint8_t> HdlcFrame::Unescape(std::span<const uint8_t> escaped, FrameError *first_error) {
  FrameError error = FrameError::kNone;
  auto note = [&error](FrameError e) {
    if (error == FrameError::kNone) {
      error = e;
    }
  };

  std::vector<uint8_t> body;
  body.reserve(escaped.size());
  for (size_t i = 0; i < escaped.size(); ++i) {
    uint8_t b = escaped[i];
    if (b == kTrailer) {
      // Dropped: a second frame or line noise glued to this one
      note(FrameError::kEmbeddedTrailer);
      continue;
    }
    if (b != kEscape) {
      body.push_back(b);
      continue;
    }
    if (i + 1 >= escaped.size()) {
      note(FrameError::kDanglingEscape);
      break;
    }
    uint8_t original = static_cast<uint8_t>(escaped[++i] ^ kEscapeMask);
    if (original != kTrailer && original != kEscape) {
      note(FrameError::kBadEscape);
    }
    body.push_back(original);
  }

  if (first_error != nullptr) {
    *first_error = error;
  }
  return body;
}

std::vector<uint8_t> HdlcFrame::Encode(uint8_t type_id, std::span<const uint8_t> payload) {
  std::vector<uint8_t> body;
  body.reserve(1 + payload.size() + kCrcSize);
  body.push_back(type_id);
  body.insert(body.end(), payload.begin(), payload.end());

  // CRC covers type_id + payload
  AppendCrc16(body);

  std::vector<uint8_t> frame = Escape(body);
  frame.push_back(kTrailer);
  return frame;
}

std::optional<DiagPacket> HdlcFrame::Decode(std::span<const uint8_t> frame, bool strict, FrameError *error) {
  FrameError result = FrameError::kNone;
  auto note = [&result](FrameError e) {
    if (result == FrameError::kNone) {
      result = e;
    }
  };

  std::span<const uint8_t> escaped = frame;
  if (frame.empty() || frame.back() != kTrailer) {
    note(FrameError::kMissingTrailer);
  } else {
    escaped = frame.first(frame.size() - 1);
  }

  FrameError escape_error = FrameError::kNone;
  std::vector<uint8_t> body = Unescape(escaped, &escape_error);
  note(escape_error);

  bool crc_present = body.size() >= kMinBodySize;
  if (!crc_present) {
    note(FrameError::kTooShort);
  } else if (!VerifyCrc16(body)) {
    note(FrameError::kCrcMismatch);
  }

  if (error != nullptr) {
    *error = result;
  }

  if (strict && result != FrameError::kNone) {
    return {};
  }

  // Best effort from here on: strip whatever stands in the CRC position
  if (crc_present) {
    body.resize(body.size() - kCrcSize);
  }
  if (body.empty()) {
    return {};
  }

  uint8_t type_id = body.front();
  std::vector<uint8_t> payload(body.begin() + 1, body.end());
  return DiagPacket(type_id, std::move(payload));
}

}  // namespace diaglink
