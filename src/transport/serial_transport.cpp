#include "transport/serial_transport.hpp"
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include "common/logger.hpp"

namespace diaglink {

namespace {

speed_t GetBaudRate(int baud) {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    case 460800:
      return B460800;
    case 921600:
      return B921600;
    default:
      return B115200;
  }
}

}  // namespace

SerialTransport::SerialTransport(std::string port_name, SerialOptions options)
    : port_name_(std::move(port_name)),
      options_(options) {
  if (Open()) {
    DIAGLINK_LOG_DEBUG("Opened serial device {}", port_name_);
  }
}

SerialTransport::SerialTransport(SerialTransport &&other) noexcept
    : port_name_(std::move(other.port_name_)),
      options_(other.options_),
      fd_(other.fd_),
      open_errno_(other.open_errno_) {
  other.fd_ = -1;
}

SerialTransport &SerialTransport::operator=(SerialTransport &&other) noexcept {
  if (this != &other) {
    Dispose();
    port_name_ = std::move(other.port_name_);
    options_ = other.options_;
    fd_ = other.fd_;
    open_errno_ = other.open_errno_;
    other.fd_ = -1;
  }
  return *this;
}

bool SerialTransport::Open() {
  fd_ = ::open(port_name_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) {
    open_errno_ = errno;
    return false;
  }

  auto fail = [this]() {
    open_errno_ = errno;
    ::close(fd_);
    fd_ = -1;
    return false;
  };

  struct termios tty;
  if (::tcgetattr(fd_, &tty) != 0) {
    return fail();
  }

  speed_t speed = GetBaudRate(options_.baud_rate);
  if (::cfsetispeed(&tty, speed) != 0 || ::cfsetospeed(&tty, speed) != 0) {
    return fail();
  }

  // Raw 8N1, no line editing, no echo, no flow control
  ::cfmakeraw(&tty);
  tty.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
  tty.c_cflag |= (CLOCAL | CREAD | CS8);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
    return fail();
  }
  ::tcflush(fd_, TCIOFLUSH);

  // Writes block; reads are bounded by poll() in Read()
  int flags = ::fcntl(fd_, F_GETFL);
  if (flags < 0 || ::fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK) != 0) {
    return fail();
  }

  return true;
}

int SerialTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }

  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int ready = ::poll(&pfd, 1, static_cast<int>(options_.poll_interval_ms));
  if (ready == 0) {
    return 0;
  }
  if (ready < 0) {
    return errno == EINTR ? 0 : -1;
  }
  if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
    DIAGLINK_LOG_DEBUG("Serial device {} hung up", port_name_);
    return -1;
  }

  ssize_t bytes_read = ::read(fd_, buffer.data(), buffer.size());
  if (bytes_read < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    DIAGLINK_LOG_DEBUG("Read from {} failed: {}", port_name_, std::strerror(errno));
    return -1;
  }
  if (bytes_read == 0) {
    // Readable with no data: the tty went away
    return -1;
  }
  return static_cast<int>(bytes_read);
}

bool SerialTransport::HasData() const {
  return AvailableBytes() > 0;
}

size_t SerialTransport::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  int bytes_available = 0;
  if (::ioctl(fd_, FIONREAD, &bytes_available) == 0 && bytes_available > 0) {
    return static_cast<size_t>(bytes_available);
  }
  return 0;
}

int SerialTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    return -1;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd_, data.data() + total, data.size() - total);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return -1;
    }
    total += static_cast<size_t>(n);
  }
  return static_cast<int>(total);
}

bool SerialTransport::Flush() {
  if (fd_ < 0) {
    return false;
  }
  return ::tcdrain(fd_) == 0;
}

void SerialTransport::Dispose() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace diaglink
