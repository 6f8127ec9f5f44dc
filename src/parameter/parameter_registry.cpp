#include "parameter/parameter_registry.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>
#include "common/log.hpp"
#include "common/status.hpp"

namespace apsyn {

bool ParameterRegistry::Add(Parameter parameter) {
  if (parameter.name.empty() || parameters_.contains(parameter.name)) {
    return false;
  }
  std::string name = parameter.name;
  parameters_.emplace(std::move(name), std::move(parameter));
  return true;
}

const Parameter *ParameterRegistry::Find(std::string_view name) const {
  auto it = parameters_.find(name);
  return it == parameters_.end() ? nullptr : &it->second;
}

std::vector<std::string> ParameterRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(parameters_.size());
  for (const auto &[name, parameter] : parameters_) {
    names.push_back(name);
  }
  return names;
}

const Parameter *ParameterRegistry::Lookup(std::string_view name) const {
  const Parameter *parameter = Find(name);
  if (parameter == nullptr) {
    Logger()->error("Instrument {} has no parameter '{}'", session_.Options().name, name);
  }
  return parameter;
}

Status ParameterRegistry::Set(std::string_view name, const ParameterValue &value) {
  const Parameter *parameter = Lookup(name);
  if (parameter == nullptr) {
    return Status::Error(ErrorKind::kUnknownParameter);
  }
  if (parameter->set_cmd.empty()) {
    Logger()->error("Parameter {} cannot be set", name);
    return Status::Error(ErrorKind::kNotSettable);
  }

  ParameterValue wire_value = value;
  if (!parameter->value_mapping.empty()) {
    const auto *text = std::get_if<std::string>(&value);
    auto it = std::find_if(parameter->value_mapping.begin(), parameter->value_mapping.end(),
                           [text](const auto &entry) { return text != nullptr && entry.first == *text; });
    if (it == parameter->value_mapping.end()) {
      Logger()->error("Cannot set {} to {}: not a mapped value", name, ToString(value));
      return Status::Error(ErrorKind::kValidationFailure);
    }
    wire_value = it->second;
  } else {
    if (parameter->validator && !parameter->validator->IsValid(value)) {
      Logger()->error("Cannot set {} to {}: expected {}", name, ToString(value), parameter->validator->Describe());
      return Status::Error(ErrorKind::kValidationFailure);
    }
    if (parameter->set_parser) {
      wire_value = parameter->set_parser(value);
    }
  }

  std::string command;
  try {
    command = std::visit([parameter](const auto &arg) { return fmt::format(fmt::runtime(parameter->set_cmd), arg); },
                         wire_value);
  } catch (const fmt::format_error &e) {
    Logger()->error("Set command '{}' of {} rejects {}: {}", parameter->set_cmd, name, ToString(wire_value), e.what());
    return Status::Error(ErrorKind::kValidationFailure);
  }
  return session_.Send(command);
}

Status ParameterRegistry::Get(std::string_view name, ParameterValue &value) {
  const Parameter *parameter = Lookup(name);
  if (parameter == nullptr) {
    return Status::Error(ErrorKind::kUnknownParameter);
  }
  if (parameter->get_cmd.empty()) {
    Logger()->error("Parameter {} cannot be read", name);
    return Status::Error(ErrorKind::kNotGettable);
  }

  std::string reply;
  Status status = session_.Query(parameter->get_cmd, reply);
  if (!status.Ok()) {
    return status;
  }

  std::optional<ParameterValue> parsed =
      parameter->get_parser ? parameter->get_parser(reply) : std::optional<ParameterValue>{reply};
  if (!parsed.has_value()) {
    Logger()->warn("Cannot parse reply '{}' to {} for {}", reply, parameter->get_cmd, name);
    return Status::Error(ErrorKind::kParseFailure);
  }

  if (!parameter->value_mapping.empty()) {
    const auto *token = std::get_if<std::string>(&*parsed);
    auto it = std::find_if(parameter->value_mapping.begin(), parameter->value_mapping.end(),
                           [token](const auto &entry) { return token != nullptr && entry.second == *token; });
    if (it == parameter->value_mapping.end()) {
      Logger()->warn("Reply '{}' to {} is not a known value of {}", reply, parameter->get_cmd, name);
      return Status::Error(ErrorKind::kParseFailure);
    }
    parsed = ParameterValue{it->first};
  }

  value = std::move(*parsed);
  return Status::Success();
}

}  // namespace apsyn
