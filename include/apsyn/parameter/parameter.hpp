#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "parameter_value.hpp"
#include "validators.hpp"

namespace apsyn {

/** Converts a raw reply into a value; empty means the reply could not be parsed. */
using GetParser = std::function<std::optional<ParameterValue>(std::string_view reply)>;

/** Converts a validated value into the token substituted into the set command. */
using SetParser = std::function<ParameterValue(const ParameterValue &value)>;

/** Ordered (user value, wire token) pairs, e.g. {"Normal", "NORM"}. */
using ValueMapping = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Declarative description of one instrument parameter
 *
 * set_cmd is an fmt format string with a single replacement field ("FREQ {:.3f}").
 * An empty set_cmd or get_cmd makes the parameter get-only or set-only.
 *
 * When value_mapping is non-empty, set values must be one of its user values and
 * are sent as the matching wire token; replies (after get_parser) are mapped back.
 */
struct Parameter {
  std::string name;
  std::string unit{};
  std::string set_cmd{};
  std::string get_cmd{};
  std::shared_ptr<const Validator> validator{};
  GetParser get_parser{};
  SetParser set_parser{};
  ValueMapping value_mapping{};
  std::string docstring{};
};

// Stock get parsers
[[nodiscard]] GetParser DoubleParser();
[[nodiscard]] GetParser IntegerParser();
[[nodiscard]] GetParser OnOffParser();
[[nodiscard]] GetParser TokenParser();

/** "on" -> "1", "off" -> "0" */
[[nodiscard]] SetParser OnOffToDigit();

}  // namespace apsyn
