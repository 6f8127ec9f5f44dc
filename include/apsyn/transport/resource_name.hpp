#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apsyn {

enum class ResourceKind {
  /** Raw SCPI over a TCP socket ("TCPIP0::host::port::SOCKET" or "host:port") */
  kTcpSocket,
  /** VXI-11 instrument ("TCPIP0::host::inst0::INSTR"); recognised but not served */
  kVxi11,
  /** Serial port ("ASRL/dev/ttyUSB0::INSTR" or "ASRL1::INSTR") */
  kSerial
};

/**
 * @brief Parsed VISA-style resource name
 */
struct ResourceName {
  ResourceKind kind{ResourceKind::kTcpSocket};
  std::string host{};
  uint16_t port{0};
  /** Device path for serial resources */
  std::string device{};
};

/**
 * @brief Parse a VISA-style resource name or a plain "host:port" pair
 * @return Parsed resource, or empty if the address is not understood
 */
[[nodiscard]] std::optional<ResourceName> ParseResourceName(std::string_view address);

}  // namespace apsyn
