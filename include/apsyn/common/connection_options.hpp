#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace apsyn {

/**
 * @brief How long the connection to the instrument lives.
 */
enum class ConnectionMode {
  /** Opened once at construction, closed at teardown */
  Persistent,
  /** Opened for each command and closed after it */
  PerCommand
};

/**
 * @brief Connection and framing options for an instrument session.
 */
struct ConnectionOptions {
  /** Instrument name used in log messages */
  std::string name{"instrument"};
  ConnectionMode mode{ConnectionMode::PerCommand};
  /** Appended to every command on write */
  std::string write_termination{"\r\n"};
  /** When unset, a reply ends once bytes have arrived and the line stays quiet for read_idle_ms. */
  std::optional<std::string> read_termination{};
  /** Time allowed for the first reply byte (and for the terminator, if one is set); 0 waits forever */
  uint32_t read_timeout_ms{1000};
  uint32_t read_idle_ms{20};
  /**
   * In PerCommand mode, a query leaves the connection open for the next command.
   * Set to close it after queries as well.
   */
  bool close_after_query{false};
};

}  // namespace apsyn
