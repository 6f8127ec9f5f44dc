#include "common/status.hpp"
#include <string_view>

namespace apsyn {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "ok";
    case ErrorKind::kConnectionFailed:
      return "connection failed";
    case ErrorKind::kCommandFailure:
      return "command failure";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kParseFailure:
      return "parse failure";
    case ErrorKind::kValidationFailure:
      return "validation failure";
    case ErrorKind::kUnknownParameter:
      return "unknown parameter";
    case ErrorKind::kNotGettable:
      return "parameter not gettable";
    case ErrorKind::kNotSettable:
      return "parameter not settable";
  }
  return "unknown error";
}

}  // namespace apsyn
