#pragma once

#include <string>
#include <variant>

namespace apsyn {

/**
 * @brief Value of an instrument parameter: numeric, or a string token ("on", "Normal", ...)
 */
using ParameterValue = std::variant<double, std::string>;

[[nodiscard]] std::string ToString(const ParameterValue &value);

}  // namespace apsyn
