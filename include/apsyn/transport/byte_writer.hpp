#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "byte_reader.hpp"

namespace apsyn {

/**
 * @brief Abstract interface for writing bytes to an instrument connection
 */
class ByteWriter {
 public:
  virtual ~ByteWriter() = default;

  /**
   * @brief Write bytes to the connection
   * @param data Bytes to write
   * @return Number of bytes actually written, or a negative device/OS error code
   */
  [[nodiscard]] virtual int Write(std::span<const uint8_t> data) = 0;

  /**
   * @brief Flush any buffered data
   * @return true on success, false on error
   */
  [[nodiscard]] virtual bool Flush() = 0;
};

/**
 * @brief Open duplex connection to one instrument
 *
 * Owning a ByteTransport means owning the connection: destroying it closes it.
 */
class ByteTransport : public ByteReader, public ByteWriter {
 public:
  ~ByteTransport() override = default;
};

}  // namespace apsyn
