#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace apsyn {

/**
 * @brief ByteTransport over a connected TCP socket (raw SCPI, e.g. port 5025)
 *
 * Takes ownership of the file descriptor; closes it in the destructor.
 */
class TcpTransport : public ByteTransport {
 public:
  /**
   * @brief Connect to host:port
   * @return Connected transport, or nullptr if the host cannot be resolved or reached
   */
  [[nodiscard]] static std::unique_ptr<TcpTransport> Connect(const std::string &host, uint16_t port);

  /**
   * @brief Wrap an already-connected socket fd (ownership taken)
   */
  explicit TcpTransport(int fd)
      : fd_(fd) {}

  ~TcpTransport() override { Close(); }

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  TcpTransport(TcpTransport &&other) noexcept
      : fd_(other.fd_) {
    other.fd_ = -1;
  }

  TcpTransport &operator=(TcpTransport &&other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override;

 private:
  int fd_;

  void Close();
};

}  // namespace apsyn
