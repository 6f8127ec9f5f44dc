#include "parameter/parameter.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <fmt/format.h>
#include "common/response_parsers.hpp"
#include "parameter/parameter_value.hpp"

namespace apsyn {

std::string ToString(const ParameterValue &value) {
  if (const auto *number = std::get_if<double>(&value)) {
    return fmt::format("{}", *number);
  }
  return std::get<std::string>(value);
}

GetParser DoubleParser() {
  return [](std::string_view reply) -> std::optional<ParameterValue> {
    auto value = ParseDouble(reply);
    if (!value.has_value()) {
      return {};
    }
    return ParameterValue{*value};
  };
}

GetParser IntegerParser() {
  return [](std::string_view reply) -> std::optional<ParameterValue> {
    auto value = ParseInteger(reply);
    if (!value.has_value()) {
      return {};
    }
    return ParameterValue{static_cast<double>(*value)};
  };
}

GetParser OnOffParser() {
  return [](std::string_view reply) -> std::optional<ParameterValue> { return ParameterValue{ParseOnOff(reply)}; };
}

GetParser TokenParser() {
  return [](std::string_view reply) -> std::optional<ParameterValue> {
    return ParameterValue{NormalizeToken(reply)};
  };
}

SetParser OnOffToDigit() {
  return [](const ParameterValue &value) -> ParameterValue {
    const auto *text = std::get_if<std::string>(&value);
    if (text != nullptr && *text == "on") {
      return std::string("1");
    }
    return std::string("0");
  };
}

}  // namespace apsyn
