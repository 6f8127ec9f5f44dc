#pragma once

#include <memory>
#include <string_view>
#include "byte_writer.hpp"
#include "serial_transport.hpp"

namespace apsyn {

/**
 * @brief Opens connections to instruments by address
 *
 * Open() acquires a connection; the caller owns it and releases it by destroying
 * the returned transport.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() = default;

  /**
   * @brief Open a connection to the instrument at address
   * @return Open transport, or nullptr if the connection could not be made
   */
  [[nodiscard]] virtual std::unique_ptr<ByteTransport> Open(std::string_view address) = 0;
};

/**
 * @brief Opens TCP socket and serial connections from VISA-style resource names
 *
 * See ParseResourceName() for the accepted address forms.
 */
class ResourceTransportFactory : public TransportFactory {
 public:
  explicit ResourceTransportFactory(SerialSettings serial_settings = {})
      : serial_settings_(serial_settings) {}

  [[nodiscard]] std::unique_ptr<ByteTransport> Open(std::string_view address) override;

 private:
  SerialSettings serial_settings_;
};

}  // namespace apsyn
