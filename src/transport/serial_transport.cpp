#include "transport/serial_transport.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include "common/log.hpp"

#ifdef __linux__
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace apsyn {

namespace {

#ifdef __linux__
speed_t GetBaudRate(int baud) {
  switch (baud) {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
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
#endif

}  // namespace

int SerialTransport::Read(std::span<uint8_t> buffer) {
#ifdef __linux__
  if (fd_ < 0) {
    return -1;
  }
  ssize_t bytes_read = ::read(fd_, buffer.data(), buffer.size());
  if (bytes_read < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return 0;
    }
    return -1;
  }
  return static_cast<int>(bytes_read);
#else
  (void)buffer;
  return -1;
#endif
}

bool SerialTransport::HasData() const {
  return AvailableBytes() > 0;
}

size_t SerialTransport::AvailableBytes() const {
#ifdef __linux__
  if (fd_ < 0) {
    return 0;
  }
  int bytes_available = 0;
  if (::ioctl(fd_, FIONREAD, &bytes_available) == 0 && bytes_available > 0) {
    return static_cast<size_t>(bytes_available);
  }
#endif
  return 0;
}

int SerialTransport::Write(std::span<const uint8_t> data) {
#ifdef __linux__
  if (fd_ < 0) {
    return -1;
  }
  ssize_t bytes_written = ::write(fd_, data.data(), data.size());
  if (bytes_written < 0) {
    return -errno;
  }
  return static_cast<int>(bytes_written);
#else
  (void)data;
  return -1;
#endif
}

bool SerialTransport::Flush() {
#ifdef __linux__
  if (fd_ < 0) {
    return false;
  }
  return ::tcdrain(fd_) == 0;
#else
  return false;
#endif
}

bool SerialTransport::Open() {
#ifdef __linux__
  // Non-blocking reads: the session polls with its own timeout
  fd_ = ::open(port_name_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    Logger()->error("Cannot open serial port {}: {}", port_name_, std::strerror(errno));
    return false;
  }

  struct termios tty;
  if (::tcgetattr(fd_, &tty) != 0) {
    Logger()->error("Cannot read settings of {}: {}", port_name_, std::strerror(errno));
    Close();
    return false;
  }

  speed_t speed = GetBaudRate(settings_.baud_rate);
  if (::cfsetispeed(&tty, speed) != 0 || ::cfsetospeed(&tty, speed) != 0) {
    Logger()->error("Cannot set baud rate {} on {}", settings_.baud_rate, port_name_);
    Close();
    return false;
  }

  tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
  tty.c_oflag &= ~OPOST;
  tty.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
  tty.c_cflag &= ~(CSIZE | PARENB | CSTOPB);

  switch (settings_.data_bits) {
    case 7:
      tty.c_cflag |= CS7;
      break;
    case 8:
    default:
      tty.c_cflag |= CS8;
      break;
  }

  switch (settings_.parity) {
    case 'E':
    case 'e':
      tty.c_cflag |= PARENB;
      tty.c_cflag &= ~PARODD;
      break;
    case 'O':
    case 'o':
      tty.c_cflag |= PARENB | PARODD;
      break;
    default:
      break;
  }

  if (settings_.stop_bits == 2) {
    tty.c_cflag |= CSTOPB;
  }

  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
    Logger()->error("Cannot configure serial port {}: {}", port_name_, std::strerror(errno));
    Close();
    return false;
  }
  return true;
#else
  return false;
#endif
}

void SerialTransport::Close() {
#ifdef __linux__
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif
}

}  // namespace apsyn
