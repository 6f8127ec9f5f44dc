#include "transport/tcp_transport.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include "common/log.hpp"

#ifdef __linux__
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace apsyn {

std::unique_ptr<TcpTransport> TcpTransport::Connect(const std::string &host, uint16_t port) {
#ifdef __linux__
  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *results = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    Logger()->error("Cannot resolve {}: {}", host, ::gai_strerror(rc));
    return nullptr;
  }

  int fd = -1;
  for (struct addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(results);

  if (fd < 0) {
    Logger()->error("Cannot connect to {}:{}: {}", host, port, std::strerror(errno));
    return nullptr;
  }

  // Commands are short; send them immediately
  int opt = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != 0) {
    Logger()->warn("TCP_NODELAY not set on {}:{}", host, port);
  }
  return std::make_unique<TcpTransport>(fd);
#else
  (void)host;
  (void)port;
  return nullptr;
#endif
}

int TcpTransport::Read(std::span<uint8_t> buffer) {
#ifdef __linux__
  if (fd_ < 0) {
    return -1;
  }
  ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return 0;
    }
    Close();
    return -1;
  }
  if (n == 0) {
    Close();  // EOF / instrument dropped the connection
    return -1;
  }
  return static_cast<int>(n);
#else
  (void)buffer;
  return -1;
#endif
}

bool TcpTransport::HasData() const {
#ifdef __linux__
  if (fd_ < 0) {
    return false;
  }
  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(fd_, &fds);
  struct timeval tv = {0, 0};
  return ::select(fd_ + 1, &fds, nullptr, nullptr, &tv) > 0;
#else
  return false;
#endif
}

size_t TcpTransport::AvailableBytes() const {
#ifdef __linux__
  if (fd_ < 0) {
    return 0;
  }
  int n = 0;
  if (::ioctl(fd_, FIONREAD, &n) == 0 && n > 0) {
    return static_cast<size_t>(n);
  }
#endif
  return 0;
}

int TcpTransport::Write(std::span<const uint8_t> data) {
#ifdef __linux__
  if (fd_ < 0) {
    return -1;
  }
  ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
  if (n < 0) {
    return -errno;
  }
  return static_cast<int>(n);
#else
  (void)data;
  return -1;
#endif
}

bool TcpTransport::Flush() {
  // TCP stream has no application-level flush
  return fd_ >= 0;
}

void TcpTransport::Close() {
#ifdef __linux__
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif
}

}  // namespace apsyn
