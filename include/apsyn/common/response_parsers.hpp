#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apsyn {

/**
 * @brief Map a digit reply to "on"/"off"
 *
 * Only the first character is inspected: '0' gives "off", '1' gives "on".
 * Any other reply is returned unchanged.
 */
[[nodiscard]] std::string ParseOnOff(std::string_view reply);

/**
 * @brief Trim surrounding whitespace and convert to upper case (" norm\n" -> "NORM")
 */
[[nodiscard]] std::string NormalizeToken(std::string_view reply);

[[nodiscard]] std::string_view Trim(std::string_view text);

/**
 * @brief Parse a reply as a floating-point number
 * @return Value, or empty if the trimmed reply is not a complete numeral
 */
[[nodiscard]] std::optional<double> ParseDouble(std::string_view reply);

/**
 * @brief Parse a reply as an integer
 * @return Value, or empty if the trimmed reply is not a complete integer
 */
[[nodiscard]] std::optional<int64_t> ParseInteger(std::string_view reply);

}  // namespace apsyn
