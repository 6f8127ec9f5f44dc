#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace apsyn {

/**
 * @brief Abstract interface for reading bytes from an instrument connection
 *
 * Lets the session talk to any byte source (TCP socket, serial port, memory buffer)
 * without knowing how the bytes arrive.
 */
class ByteReader {
 public:
  virtual ~ByteReader() = default;

  /**
   * @brief Read bytes from the connection
   * @param buffer Buffer to store read bytes
   * @return Number of bytes actually read (0 if no data available, -1 on error)
   */
  [[nodiscard]] virtual int Read(std::span<uint8_t> buffer) = 0;

  /**
   * @brief Check if data is waiting to be read
   */
  [[nodiscard]] virtual bool HasData() const = 0;

  /**
   * @brief Get the number of bytes waiting to be read
   * @return Number of bytes available (0 if unknown/unavailable)
   */
  [[nodiscard]] virtual size_t AvailableBytes() const = 0;
};

}  // namespace apsyn
