#pragma once

#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "parameter_value.hpp"

namespace apsyn {

/**
 * @brief Accepts or rejects values before they are sent to the instrument
 */
class Validator {
 public:
  virtual ~Validator() = default;

  [[nodiscard]] virtual bool IsValid(const ParameterValue &value) const = 0;

  /**
   * @brief Human-readable description of the accepted values, for log messages
   */
  [[nodiscard]] virtual std::string Describe() const = 0;
};

/**
 * @brief Numeric value in the closed range [min, max]; NaN is rejected
 */
class Numbers : public Validator {
 public:
  explicit Numbers(double min_value = -std::numeric_limits<double>::infinity(),
                   double max_value = std::numeric_limits<double>::infinity())
      : min_value_(min_value),
        max_value_(max_value) {}

  [[nodiscard]] bool IsValid(const ParameterValue &value) const override;
  [[nodiscard]] std::string Describe() const override;

  [[nodiscard]] double Min() const { return min_value_; }
  [[nodiscard]] double Max() const { return max_value_; }

 private:
  double min_value_;
  double max_value_;
};

/**
 * @brief One of a fixed set of strings (case-sensitive)
 */
class Enum : public Validator {
 public:
  explicit Enum(std::vector<std::string> values)
      : values_(std::move(values)) {}

  [[nodiscard]] bool IsValid(const ParameterValue &value) const override;
  [[nodiscard]] std::string Describe() const override;

 private:
  std::vector<std::string> values_;
};

/**
 * @brief "on" or "off"
 */
class OnOff : public Enum {
 public:
  OnOff()
      : Enum({"on", "off"}) {}
};

}  // namespace apsyn
