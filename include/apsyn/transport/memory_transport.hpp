#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace apsyn {

/**
 * @brief In-memory transport for tests and offline use
 *
 * Bytes written are collected in a write buffer; bytes handed to SetReadData()
 * are served by Read(). A negative write result can be injected to simulate a
 * device-reported error.
 */
class MemoryTransport : public ByteTransport {
 public:
  static constexpr size_t kDefaultInitialCapacity = 256;
  explicit MemoryTransport(size_t initial_capacity = kDefaultInitialCapacity) {
    read_buffer_.reserve(initial_capacity);
    write_buffer_.reserve(initial_capacity);
  }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (read_pos_ >= read_buffer_.size()) {
      return 0;  // No data available
    }

    size_t bytes_to_read = std::min(buffer.size(), read_buffer_.size() - read_pos_);
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] bool HasData() const override { return read_pos_ < read_buffer_.size(); }

  [[nodiscard]] size_t AvailableBytes() const override { return read_buffer_.size() - read_pos_; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    if (write_error_ < 0) {
      return write_error_;
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return true; }

  // MemoryTransport-specific methods
  /**
   * @brief Set the data that will be read by Read()
   */
  void SetReadData(std::span<const uint8_t> data) {
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  void SetReadData(std::string_view text) {
    read_buffer_.assign(text.begin(), text.end());
    read_pos_ = 0;
  }

  /**
   * @brief Make every following Write() fail with the given (negative) code; 0 clears it
   */
  void SetWriteError(int code) { write_error_ = code; }

  /**
   * @brief Get the data that was written via Write()
   */
  [[nodiscard]] std::span<const uint8_t> GetWrittenData() const { return {write_buffer_.data(), write_buffer_.size()}; }

  [[nodiscard]] std::string GetWrittenText() const { return {write_buffer_.begin(), write_buffer_.end()}; }

  void ClearWriteBuffer() { write_buffer_.clear(); }

  void ResetReadPosition() { read_pos_ = 0; }

 private:
  std::vector<uint8_t> read_buffer_;
  size_t read_pos_{0};
  std::vector<uint8_t> write_buffer_;
  int write_error_{0};
};

}  // namespace apsyn
