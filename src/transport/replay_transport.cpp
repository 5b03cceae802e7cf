#include "transport/replay_transport.hpp"
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "common/logger.hpp"

namespace diaglink {

ReplayTransport::ReplayTransport(std::string path)
    : path_(std::move(path)) {
  fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    open_errno_ = errno;
  }
}

int ReplayTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }
  while (true) {
    ssize_t n = ::read(fd_, buffer.data(), buffer.size());
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      DIAGLINK_LOG_DEBUG("End of capture file {}", path_);
      return -1;
    }
    return static_cast<int>(n);
  }
}

size_t ReplayTransport::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  struct stat st {};
  off_t pos = ::lseek(fd_, 0, SEEK_CUR);
  if (pos < 0 || ::fstat(fd_, &st) != 0 || st.st_size <= pos) {
    return 0;
  }
  return static_cast<size_t>(st.st_size - pos);
}

int ReplayTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    return -1;
  }
  return static_cast<int>(data.size());
}

void ReplayTransport::Dispose() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace diaglink
