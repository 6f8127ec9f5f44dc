#include "parameter/validators.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <variant>
#include <fmt/format.h>
#include "parameter/parameter_value.hpp"

namespace apsyn {

bool Numbers::IsValid(const ParameterValue &value) const {
  const auto *number = std::get_if<double>(&value);
  if (number == nullptr || std::isnan(*number)) {
    return false;
  }
  return *number >= min_value_ && *number <= max_value_;
}

std::string Numbers::Describe() const {
  return fmt::format("a number in [{}, {}]", min_value_, max_value_);
}

bool Enum::IsValid(const ParameterValue &value) const {
  const auto *text = std::get_if<std::string>(&value);
  if (text == nullptr) {
    return false;
  }
  return std::find(values_.begin(), values_.end(), *text) != values_.end();
}

std::string Enum::Describe() const {
  return fmt::format("one of {{{}}}", fmt::join(values_, ", "));
}

}  // namespace apsyn
