#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "../common/connection_options.hpp"
#include "../common/status.hpp"
#include "../parameter/parameter_registry.hpp"
#include "../parameter/parameter_value.hpp"
#include "../session/scpi_session.hpp"
#include "../transport/transport_factory.hpp"

namespace apsyn {

enum class PulsePolarity { kNormal, kInverted };
enum class PulseSource { kInternal, kExternal };

/**
 * @brief Driver for the AnaPico APSYN420 signal generator
 *
 * Exposes frequency, output, blanking and pulse modulation settings as named
 * parameters (see Parameters().Names()) with typed accessors on top.
 *
 * Typed getters return an empty optional and setters return false on failure;
 * LastStatus() tells why.
 */
class Apsyn420 {
 public:
  static constexpr double kMinFrequencyHz = 2490236.0;
  static constexpr double kMaxFrequencyHz = 20e9;
  static constexpr double kDefaultReferenceHz = 10e6;
  /** The instrument ends every reply with a line feed */
  static constexpr std::string_view kReadTermination = "\n";

  /**
   * @brief Construct the driver
   * @param name Instrument name used in log messages
   * @param address Resource name, e.g. "TCPIP0::192.168.15.100::18::SOCKET"
   * @param factory Opens connections; must outlive the driver
   * @param close_after_every_command Open and close the connection around each command
   * @param options Remaining connection options; name and mode are taken from the arguments above,
   *        and an unset read_termination becomes kReadTermination
   *
   * ResourceTransportFactory opens raw sockets and serial ports only. VXI-11 names such as
   * "TCPIP0::host::inst0::INSTR" are refused with kConnectionFailed; use the instrument's
   * socket port instead ("TCPIP0::host::18::SOCKET").
   */
  Apsyn420(std::string name, std::string address, TransportFactory &factory, bool close_after_every_command = true,
           ConnectionOptions options = {});

  Apsyn420(const Apsyn420 &) = delete;
  Apsyn420 &operator=(const Apsyn420 &) = delete;

  [[nodiscard]] std::optional<double> Frequency();
  [[nodiscard]] bool SetFrequency(double hz);

  // On/off settings read back as "on" or "off"; an unrecognised reply is returned as sent
  [[nodiscard]] std::optional<std::string> Output();
  [[nodiscard]] bool SetOutput(bool on);
  [[nodiscard]] std::optional<std::string> Blanking();
  [[nodiscard]] bool SetBlanking(bool on);
  [[nodiscard]] std::optional<std::string> PulseModulationState();
  [[nodiscard]] bool SetPulseModulationState(bool on);

  [[nodiscard]] std::optional<PulsePolarity> PulseModulationPolarity();
  [[nodiscard]] bool SetPulseModulationPolarity(PulsePolarity polarity);
  [[nodiscard]] std::optional<PulseSource> PulseModulationSource();
  [[nodiscard]] bool SetPulseModulationSource(PulseSource source);

  [[nodiscard]] std::optional<double> PulseModulationPeriod();
  [[nodiscard]] bool SetPulseModulationPeriod(double seconds);
  [[nodiscard]] std::optional<double> PulseModulationPulseWidth();
  [[nodiscard]] bool SetPulseModulationPulseWidth(double seconds);

  [[nodiscard]] bool RfOn() { return SetOutput(true); }
  [[nodiscard]] bool RfOff() { return SetOutput(false); }

  /**
   * @brief Restore instrument defaults (*RST)
   */
  [[nodiscard]] bool Reset();

  /**
   * @brief Lock to an external reference and output it on the reference output
   *
   * frequency_hz must be finite and within [1 Hz, kMaxFrequencyHz], otherwise
   * kValidationFailure is returned and nothing is sent.
   * Sends the four ROSC configuration commands, then polls ROSC:LOCK? every
   * poll_interval until the instrument reports 1. There is no timeout: if the
   * reference never locks this call never returns. Transport and parse failures
   * end the wait and are returned.
   */
  [[nodiscard]] Status SetExternalReference(double frequency_hz = kDefaultReferenceHz,
                                            std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

  [[nodiscard]] Status LastStatus() const { return last_status_; }
  [[nodiscard]] const std::string &Name() const { return name_; }

  [[nodiscard]] ScpiSession &Session() { return session_; }
  [[nodiscard]] ParameterRegistry &Parameters() { return parameters_; }

 private:
  void AddParameters();

  [[nodiscard]] std::optional<ParameterValue> GetValue(std::string_view parameter);
  [[nodiscard]] bool SetValue(std::string_view parameter, const ParameterValue &value);
  [[nodiscard]] std::optional<double> GetNumber(std::string_view parameter);
  [[nodiscard]] std::optional<std::string> GetText(std::string_view parameter);

  std::string name_;
  ScpiSession session_;
  ParameterRegistry parameters_;
  Status last_status_{};
};

}  // namespace apsyn
