#include "session/scpi_session.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include "common/log.hpp"

namespace apsyn {

namespace {

constexpr size_t kReadChunkSize = 256;

}  // namespace

ScpiSession::ScpiSession(TransportFactory &factory, std::string address, ConnectionOptions options)
    : factory_(factory),
      address_(std::move(address)),
      options_(std::move(options)) {
  if (options_.mode == ConnectionMode::Persistent) {
    Status status = EnsureOpen();
    if (!status.Ok()) {
      Logger()->error("Instrument {}: initial connection to {} failed, retrying on first command", options_.name,
                      address_);
    }
  }
}

Status ScpiSession::Send(std::string_view command) {
  if (!IsValidCommand(command)) {
    Logger()->error("Instrument {}: refusing malformed command '{}'", options_.name, command);
    return Status::Error(ErrorKind::kValidationFailure);
  }
  Logger()->debug("Writing to instrument {}: {}", options_.name, command);

  Status status = EnsureOpen();
  if (status.Ok()) {
    status = WriteCommand(command);
  }
  if (options_.mode == ConnectionMode::PerCommand) {
    Close();
  }
  return status;
}

Status ScpiSession::Query(std::string_view command, std::string &response) {
  if (!IsValidCommand(command)) {
    Logger()->error("Instrument {}: refusing malformed query '{}'", options_.name, command);
    return Status::Error(ErrorKind::kValidationFailure);
  }
  Logger()->debug("Querying instrument {}: {}", options_.name, command);

  Status status = EnsureOpen();
  if (status.Ok()) {
    status = DiscardPendingInput();
  }
  if (status.Ok()) {
    status = WriteCommand(command);
  }
  if (status.Ok()) {
    status = ReadResponse(response);
  }
  if (status.Ok()) {
    Logger()->trace("Instrument {} replied: {}", options_.name, response);
  }
  // The connection stays open after a PerCommand query; the next Send() reuses and closes it
  if (options_.mode == ConnectionMode::PerCommand && options_.close_after_query) {
    Close();
  }
  return status;
}

void ScpiSession::EnablePerCommandMode() {
  if (options_.mode != ConnectionMode::PerCommand) {
    Logger()->debug("Instrument {}: switching to per-command connections", options_.name);
    options_.mode = ConnectionMode::PerCommand;
  }
}

void ScpiSession::EnablePersistentMode() {
  if (options_.mode != ConnectionMode::Persistent) {
    Logger()->debug("Instrument {}: switching to a persistent connection", options_.name);
    options_.mode = ConnectionMode::Persistent;
  }
}

void ScpiSession::Close() {
  handle_.reset();
}

Status ScpiSession::EnsureOpen() {
  if (handle_) {
    return Status::Success();
  }
  handle_ = factory_.Open(address_);
  if (!handle_) {
    Logger()->error("Instrument {}: cannot open {}", options_.name, address_);
    return Status::Error(ErrorKind::kConnectionFailed);
  }
  return Status::Success();
}

Status ScpiSession::WriteCommand(std::string_view command) {
  std::string frame(command);
  frame += options_.write_termination;
  std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t *>(frame.data()), frame.size());

  while (!bytes.empty()) {
    int written = handle_->Write(bytes);
    if (written <= 0) {
      Logger()->error("Instrument {}: write of '{}' failed with code {}", options_.name, command, written);
      return Status::Error(ErrorKind::kCommandFailure, written);
    }
    bytes = bytes.subspan(std::min(static_cast<size_t>(written), bytes.size()));
  }
  if (!handle_->Flush()) {
    Logger()->error("Instrument {}: flush after '{}' failed", options_.name, command);
    return Status::Error(ErrorKind::kCommandFailure);
  }
  return Status::Success();
}

Status ScpiSession::DiscardPendingInput() {
  size_t discarded = 0;
  while (handle_->HasData()) {
    uint8_t temp[kReadChunkSize];
    int n = handle_->Read(std::span<uint8_t>(temp, sizeof(temp)));
    if (n < 0) {
      Logger()->error("Instrument {}: read failed with code {}", options_.name, n);
      return Status::Error(ErrorKind::kCommandFailure, n);
    }
    if (n == 0) {
      break;
    }
    discarded += static_cast<size_t>(n);
  }
  if (discarded > 0) {
    Logger()->warn("Instrument {}: discarded {} stale bytes before query", options_.name, discarded);
  }
  return Status::Success();
}

Status ScpiSession::ReadResponse(std::string &response) {
  using std::chrono::milliseconds;
  using std::chrono::steady_clock;

  response.clear();
  const auto &terminator = options_.read_termination;
  const bool terminated = terminator.has_value() && !terminator->empty();
  auto start_time = steady_clock::now();
  auto last_byte_time = start_time;

  while (true) {
    uint8_t temp[kReadChunkSize];
    int n = handle_->Read(std::span<uint8_t>(temp, sizeof(temp)));
    if (n < 0) {
      Logger()->error("Instrument {}: read failed with code {}", options_.name, n);
      return Status::Error(ErrorKind::kCommandFailure, n);
    }
    auto now = steady_clock::now();
    if (n > 0) {
      response.append(reinterpret_cast<const char *>(temp), static_cast<size_t>(n));
      last_byte_time = now;
      if (terminated && response.ends_with(*terminator)) {
        response.resize(response.size() - terminator->size());
        return Status::Success();
      }
      continue;
    }

    // Without a terminator a reply is complete once the line has been quiet long enough
    if (!terminated && !response.empty() &&
        now - last_byte_time >= milliseconds(options_.read_idle_ms)) {
      return Status::Success();
    }
    if (options_.read_timeout_ms > 0 && (terminated || response.empty()) &&
        now - start_time >= milliseconds(options_.read_timeout_ms)) {
      Logger()->warn("Instrument {}: no complete reply within {} ms", options_.name, options_.read_timeout_ms);
      return Status::Error(ErrorKind::kTimeout);
    }
    std::this_thread::sleep_for(milliseconds(1));
  }
}

bool ScpiSession::IsValidCommand(std::string_view command) const {
  if (command.empty()) {
    return false;
  }
  if (!options_.write_termination.empty() && command.find(options_.write_termination) != std::string_view::npos) {
    return false;
  }
  return std::all_of(command.begin(), command.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

}  // namespace apsyn
