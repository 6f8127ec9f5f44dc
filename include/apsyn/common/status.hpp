#pragma once

#include <cstdint>
#include <string_view>

namespace apsyn {

enum class ErrorKind : uint8_t {
  kNone = 0,
  kConnectionFailed = 1,
  kCommandFailure = 2,
  kTimeout = 3,
  kParseFailure = 4,
  kValidationFailure = 5,
  kUnknownParameter = 6,
  kNotGettable = 7,
  kNotSettable = 8
};

/**
 * @brief Outcome of a command, query or parameter access
 *
 * device_code carries the transport-reported error code for kCommandFailure.
 */
struct Status {
  ErrorKind kind{ErrorKind::kNone};
  int device_code{0};

  [[nodiscard]] bool Ok() const { return kind == ErrorKind::kNone; }

  static Status Success() { return {}; }
  static Status Error(ErrorKind kind, int device_code = 0) { return {kind, device_code}; }
};

[[nodiscard]] std::string_view ToString(ErrorKind kind);

}  // namespace apsyn
