#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace apsyn {

/**
 * @brief Line settings for serial instrument connections
 */
struct SerialSettings {
  int baud_rate{115200};
  /** 'N' (none), 'E' (even), 'O' (odd) */
  char parity{'N'};
  int data_bits{8};
  int stop_bits{1};
};

/**
 * @brief POSIX serial port transport (termios, raw mode)
 *
 * Opens and configures the port on construction; check IsOpen() afterwards.
 */
class SerialTransport : public ByteTransport {
 public:
  SerialTransport(std::string port_name, SerialSettings settings = {})
      : port_name_(std::move(port_name)),
        settings_(settings) {
    Open();
  }

  ~SerialTransport() override { Close(); }

  SerialTransport(const SerialTransport &) = delete;
  SerialTransport &operator=(const SerialTransport &) = delete;

  SerialTransport(SerialTransport &&other) noexcept
      : port_name_(std::move(other.port_name_)),
        settings_(other.settings_),
        fd_(other.fd_) {
    other.fd_ = -1;
  }

  SerialTransport &operator=(SerialTransport &&other) noexcept {
    if (this != &other) {
      Close();
      port_name_ = std::move(other.port_name_);
      settings_ = other.settings_;
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }
  [[nodiscard]] const std::string &PortName() const { return port_name_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override;

 private:
  std::string port_name_;
  SerialSettings settings_;
  int fd_{-1};

  bool Open();
  void Close();
};

}  // namespace apsyn
