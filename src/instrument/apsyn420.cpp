#include "instrument/apsyn420.hpp"
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <fmt/format.h>
#include "common/log.hpp"
#include "common/response_parsers.hpp"
#include "parameter/parameter.hpp"
#include "parameter/validators.hpp"

namespace apsyn {

namespace {

constexpr std::string_view kFrequency = "frequency";
constexpr std::string_view kBlanking = "blanking";
constexpr std::string_view kOutput = "output";
constexpr std::string_view kPulmState = "pulm_state";
constexpr std::string_view kPulmPolarity = "pulm_polarity";
constexpr std::string_view kPulmSource = "pulm_source";
constexpr std::string_view kPulmPeriod = "pulm_int_period";
constexpr std::string_view kPulmPulseWidth = "pulm_int_pulse_width";

constexpr std::string_view kNormal = "Normal";
constexpr std::string_view kInverted = "Inverted";
constexpr std::string_view kInternal = "Internal";
constexpr std::string_view kExternal = "External";

ConnectionOptions MakeOptions(std::string name, bool close_after_every_command, ConnectionOptions options) {
  options.name = std::move(name);
  options.mode = close_after_every_command ? ConnectionMode::PerCommand : ConnectionMode::Persistent;
  if (!options.read_termination.has_value()) {
    options.read_termination = std::string(Apsyn420::kReadTermination);
  }
  return options;
}

Parameter OnOffParameter(std::string_view name, std::string_view command, std::string docstring) {
  return Parameter{.name = std::string(name),
                   .set_cmd = fmt::format("{} {{}}", command),
                   .get_cmd = fmt::format("{}?", command),
                   .validator = std::make_shared<OnOff>(),
                   .get_parser = OnOffParser(),
                   .set_parser = OnOffToDigit(),
                   .docstring = std::move(docstring)};
}

}  // namespace

Apsyn420::Apsyn420(std::string name, std::string address, TransportFactory &factory, bool close_after_every_command,
                   ConnectionOptions options)
    : name_(name),
      session_(factory, std::move(address), MakeOptions(std::move(name), close_after_every_command, std::move(options))),
      parameters_(session_) {
  AddParameters();
}

void Apsyn420::AddParameters() {
  parameters_.Add(Parameter{.name = std::string(kFrequency),
                            .unit = "Hz",
                            .set_cmd = "FREQ {:.3f}",
                            .get_cmd = "FREQ?",
                            .validator = std::make_shared<Numbers>(kMinFrequencyHz, kMaxFrequencyHz),
                            .get_parser = DoubleParser(),
                            .docstring = "CW output frequency"});

  parameters_.Add(OnOffParameter(kBlanking, "OUTP:BLAN", "RF blanking while the frequency changes"));
  parameters_.Add(OnOffParameter(kOutput, "OUTP", "RF output enable"));
  parameters_.Add(OnOffParameter(kPulmState, "PULM:STAT", "Pulse modulation enable"));

  parameters_.Add(Parameter{.name = std::string(kPulmPolarity),
                            .set_cmd = "PULM:POL {}",
                            .get_cmd = "PULM:POL?",
                            .get_parser = TokenParser(),
                            .value_mapping = {{std::string(kNormal), "NORM"}, {std::string(kInverted), "INV"}},
                            .docstring = "Pulse modulation input polarity: \"Normal\" or \"Inverted\""});

  parameters_.Add(Parameter{.name = std::string(kPulmSource),
                            .set_cmd = "PULM:SOUR {}",
                            .get_cmd = "PULM:SOUR?",
                            .get_parser = TokenParser(),
                            .value_mapping = {{std::string(kInternal), "INT"}, {std::string(kExternal), "EXT"}},
                            .docstring = "Pulse modulation source: \"Internal\" or \"External\""});

  parameters_.Add(Parameter{.name = std::string(kPulmPeriod),
                            .unit = "s",
                            .set_cmd = "PULM:INT:PER {:e}",
                            .get_cmd = "PULM:INT:PER?",
                            .validator = std::make_shared<Numbers>(0.0),
                            .get_parser = DoubleParser(),
                            .docstring = "Internal pulse modulation period"});

  parameters_.Add(Parameter{.name = std::string(kPulmPulseWidth),
                            .unit = "s",
                            .set_cmd = "PULM:INT:PWID {:e}",
                            .get_cmd = "PULM:INT:PWID?",
                            .validator = std::make_shared<Numbers>(0.0),
                            .get_parser = DoubleParser(),
                            .docstring = "Internal pulse modulation pulse width"});
}

std::optional<double> Apsyn420::Frequency() {
  return GetNumber(kFrequency);
}

bool Apsyn420::SetFrequency(double hz) {
  return SetValue(kFrequency, hz);
}

std::optional<std::string> Apsyn420::Output() {
  return GetText(kOutput);
}

bool Apsyn420::SetOutput(bool on) {
  return SetValue(kOutput, std::string(on ? "on" : "off"));
}

std::optional<std::string> Apsyn420::Blanking() {
  return GetText(kBlanking);
}

bool Apsyn420::SetBlanking(bool on) {
  return SetValue(kBlanking, std::string(on ? "on" : "off"));
}

std::optional<std::string> Apsyn420::PulseModulationState() {
  return GetText(kPulmState);
}

bool Apsyn420::SetPulseModulationState(bool on) {
  return SetValue(kPulmState, std::string(on ? "on" : "off"));
}

std::optional<PulsePolarity> Apsyn420::PulseModulationPolarity() {
  auto text = GetText(kPulmPolarity);
  if (!text.has_value()) {
    return {};
  }
  return *text == kInverted ? PulsePolarity::kInverted : PulsePolarity::kNormal;
}

bool Apsyn420::SetPulseModulationPolarity(PulsePolarity polarity) {
  return SetValue(kPulmPolarity, std::string(polarity == PulsePolarity::kInverted ? kInverted : kNormal));
}

std::optional<PulseSource> Apsyn420::PulseModulationSource() {
  auto text = GetText(kPulmSource);
  if (!text.has_value()) {
    return {};
  }
  return *text == kExternal ? PulseSource::kExternal : PulseSource::kInternal;
}

bool Apsyn420::SetPulseModulationSource(PulseSource source) {
  return SetValue(kPulmSource, std::string(source == PulseSource::kExternal ? kExternal : kInternal));
}

std::optional<double> Apsyn420::PulseModulationPeriod() {
  return GetNumber(kPulmPeriod);
}

bool Apsyn420::SetPulseModulationPeriod(double seconds) {
  return SetValue(kPulmPeriod, seconds);
}

std::optional<double> Apsyn420::PulseModulationPulseWidth() {
  return GetNumber(kPulmPulseWidth);
}

bool Apsyn420::SetPulseModulationPulseWidth(double seconds) {
  return SetValue(kPulmPulseWidth, seconds);
}

bool Apsyn420::Reset() {
  Logger()->debug("Resetting {}", name_);
  last_status_ = session_.Send("*RST");
  return last_status_.Ok();
}

Status Apsyn420::SetExternalReference(double frequency_hz, std::chrono::milliseconds poll_interval) {
  if (!std::isfinite(frequency_hz) || frequency_hz < 1.0 || frequency_hz > kMaxFrequencyHz) {
    Logger()->error("Invalid external reference frequency {} Hz for {}", frequency_hz, name_);
    last_status_ = Status::Error(ErrorKind::kValidationFailure);
    return last_status_;
  }
  Logger()->debug("Setting the oscillator source of {} to external", name_);
  const auto reference = static_cast<int64_t>(frequency_hz);
  const std::array<std::string, 4> commands{
      "ROSC:SOUR EXT",
      fmt::format("ROSC:EXT:FREQ {}", reference),
      "ROSC:OUTP:STATE 1",
      fmt::format("ROSC:OUTP:FREQ {}", reference),
  };
  for (const auto &command : commands) {
    last_status_ = session_.Send(command);
    if (!last_status_.Ok()) {
      return last_status_;
    }
  }

  while (true) {
    std::string reply;
    last_status_ = session_.Query("ROSC:LOCK?", reply);
    if (!last_status_.Ok()) {
      return last_status_;
    }
    auto locked = ParseInteger(reply);
    if (!locked.has_value()) {
      Logger()->warn("Cannot parse lock state '{}' from {}", reply, name_);
      last_status_ = Status::Error(ErrorKind::kParseFailure);
      return last_status_;
    }
    if (*locked == 1) {
      return last_status_;
    }
    Logger()->info("Waiting for lock on {}", name_);
    std::this_thread::sleep_for(poll_interval);
  }
}

std::optional<ParameterValue> Apsyn420::GetValue(std::string_view parameter) {
  ParameterValue value;
  last_status_ = parameters_.Get(parameter, value);
  if (!last_status_.Ok()) {
    return {};
  }
  return value;
}

bool Apsyn420::SetValue(std::string_view parameter, const ParameterValue &value) {
  last_status_ = parameters_.Set(parameter, value);
  return last_status_.Ok();
}

std::optional<double> Apsyn420::GetNumber(std::string_view parameter) {
  auto value = GetValue(parameter);
  if (!value.has_value()) {
    return {};
  }
  return std::get<double>(*value);
}

std::optional<std::string> Apsyn420::GetText(std::string_view parameter) {
  auto value = GetValue(parameter);
  if (!value.has_value()) {
    return {};
  }
  return std::get<std::string>(std::move(*value));
}

}  // namespace apsyn
