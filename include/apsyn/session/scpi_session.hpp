#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "../common/connection_options.hpp"
#include "../common/status.hpp"
#include "../transport/byte_writer.hpp"
#include "../transport/transport_factory.hpp"

namespace apsyn {

/**
 * @brief Command/response transactions with an instrument over a byte stream
 *
 * Owns the connection handle. In Persistent mode the connection is opened at
 * construction and kept until the session is destroyed. In PerCommand mode Send()
 * opens a connection if none is open, writes, and always closes it before returning.
 * Query() opens the same way but leaves the connection open for the next command
 * unless ConnectionOptions::close_after_query is set.
 *
 * Not thread-safe: one session per physical instrument, calls serialized by the caller.
 */
class ScpiSession {
 public:
  /**
   * @brief Construct a session
   * @param factory Opens connections; must outlive the session
   * @param address Resource name passed to factory.Open()
   * @param options Connection mode, terminators and timeouts
   */
  ScpiSession(TransportFactory &factory, std::string address, ConnectionOptions options = {});

  ScpiSession(const ScpiSession &) = delete;
  ScpiSession &operator=(const ScpiSession &) = delete;

  /**
   * @brief Write one command followed by the write terminator
   * @param command Non-empty ASCII command without the write terminator
   * @return kCommandFailure with the transport code if the write fails
   */
  [[nodiscard]] Status Send(std::string_view command);

  /**
   * @brief Write one command and read the instrument's reply
   * @param command Non-empty ASCII command without the write terminator
   * @param response Receives the reply, read terminator removed
   */
  [[nodiscard]] Status Query(std::string_view command, std::string &response);

  void EnablePerCommandMode();
  void EnablePersistentMode();
  [[nodiscard]] ConnectionMode Mode() const { return options_.mode; }

  [[nodiscard]] bool IsConnected() const { return handle_ != nullptr; }

  /**
   * @brief Close the connection now, if one is open
   */
  void Close();

  [[nodiscard]] const std::string &Address() const { return address_; }
  [[nodiscard]] const ConnectionOptions &Options() const { return options_; }

 private:
  [[nodiscard]] Status EnsureOpen();
  [[nodiscard]] Status WriteCommand(std::string_view command);
  // Drops bytes left over from an earlier reply so they cannot answer this query
  [[nodiscard]] Status DiscardPendingInput();
  [[nodiscard]] Status ReadResponse(std::string &response);
  [[nodiscard]] bool IsValidCommand(std::string_view command) const;

  TransportFactory &factory_;
  std::string address_;
  ConnectionOptions options_;
  std::unique_ptr<ByteTransport> handle_{};
};

}  // namespace apsyn
