#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "../common/status.hpp"
#include "../session/scpi_session.hpp"
#include "parameter.hpp"
#include "parameter_value.hpp"

namespace apsyn {

/**
 * @brief Named parameters of one instrument, read and written through a session
 *
 * Each Get() or Set() performs exactly one session transaction.
 */
class ParameterRegistry {
 public:
  explicit ParameterRegistry(ScpiSession &session)
      : session_(session) {}

  /**
   * @brief Register a parameter
   * @return false if the name is empty or already registered
   */
  bool Add(Parameter parameter);

  [[nodiscard]] const Parameter *Find(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> Names() const;

  /**
   * @brief Validate value, format the set command and send it
   */
  [[nodiscard]] Status Set(std::string_view name, const ParameterValue &value);

  /**
   * @brief Query the parameter and parse the reply into value
   */
  [[nodiscard]] Status Get(std::string_view name, ParameterValue &value);

 private:
  [[nodiscard]] const Parameter *Lookup(std::string_view name) const;

  ScpiSession &session_;
  std::map<std::string, Parameter, std::less<>> parameters_{};
};

}  // namespace apsyn
