#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace diaglink {

/**
 * @brief Read/dispatch loop settings for an InputSession.
 */
struct SessionOptions {
  /** Largest chunk requested from the transport per read. */
  size_t read_chunk_size{16 * 1024};
  /** Bytes buffered without a trailer before they are dropped as one skipped frame. */
  size_t max_frame_size{4 * 1024 * 1024};
  /** Log every received and sent packet (type and hex payload) at debug level. */
  bool log_packets{false};
};

/**
 * @brief Settings for a POSIX serial/character device transport.
 */
struct SerialOptions {
  int baud_rate{115200};
  /** Read returns 0 after this long without data, so callers can observe cancellation. */
  uint32_t poll_interval_ms{200};
};

/**
 * @brief Settings for a forwarded TCP bridge transport.
 */
struct TcpOptions {
  std::string host{"127.0.0.1"};
  /** Port the DIAG bridge of a rooted Android device is usually forwarded to. */
  uint16_t port{43555};
  uint32_t poll_interval_ms{200};
};

/**
 * @brief Settings for a raw USB bulk transport.
 */
struct UsbOptions {
  /** Bulk IN transfer timeout; a timeout is reported as "no data yet". */
  uint32_t read_timeout_ms{200};
  /** Bulk OUT transfer timeout. */
  uint32_t write_timeout_ms{1000};
};

}  // namespace diaglink
