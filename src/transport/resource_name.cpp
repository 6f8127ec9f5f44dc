#include "transport/resource_name.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apsyn {

namespace {

constexpr std::string_view kSeparator = "::";
constexpr std::string_view kTcpipPrefix = "TCPIP";
constexpr std::string_view kSerialPrefix = "ASRL";

std::string ToUpper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

bool StartsWithNoCase(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && ToUpper(text.substr(0, prefix.size())) == prefix;
}

bool IsAllDigits(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string_view> Split(std::string_view text) {
  std::vector<std::string_view> tokens;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(kSeparator, start);
    if (pos == std::string_view::npos) {
      tokens.push_back(text.substr(start));
      return tokens;
    }
    tokens.push_back(text.substr(start, pos - start));
    start = pos + kSeparator.size();
  }
}

std::optional<uint16_t> ParsePort(std::string_view text) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 || value > 0xFFFF) {
    return {};
  }
  return static_cast<uint16_t>(value);
}

std::optional<ResourceName> ParseTcpip(const std::vector<std::string_view> &tokens) {
  // Board number after "TCPIP" is optional and ignored
  if (!IsAllDigits(tokens[0].substr(kTcpipPrefix.size())) || tokens.size() < 3 || tokens[1].empty()) {
    return {};
  }
  const std::string suffix = ToUpper(tokens.back());
  if (suffix == "SOCKET" && tokens.size() == 4) {
    auto port = ParsePort(tokens[2]);
    if (!port.has_value()) {
      return {};
    }
    return ResourceName{ResourceKind::kTcpSocket, std::string(tokens[1]), *port, {}};
  }
  if (suffix == "INSTR" && tokens.size() <= 4) {
    return ResourceName{ResourceKind::kVxi11, std::string(tokens[1]), 0, {}};
  }
  return {};
}

std::optional<ResourceName> ParseSerial(const std::vector<std::string_view> &tokens) {
  if (tokens.size() > 2 || (tokens.size() == 2 && ToUpper(tokens[1]) != "INSTR")) {
    return {};
  }
  std::string_view device = tokens[0].substr(kSerialPrefix.size());
  if (device.empty()) {
    return {};
  }
  ResourceName resource{ResourceKind::kSerial, {}, 0, std::string(device)};
  if (IsAllDigits(device)) {
    // ASRL1 is the first serial port
    int index = 0;
    auto [ptr, ec] = std::from_chars(device.data(), device.data() + device.size(), index);
    if (ec != std::errc{} || index < 1) {
      return {};
    }
    resource.device = "/dev/ttyS" + std::to_string(index - 1);
  }
  return resource;
}

}  // namespace

std::optional<ResourceName> ParseResourceName(std::string_view address) {
  if (address.empty()) {
    return {};
  }
  auto tokens = Split(address);
  if (StartsWithNoCase(tokens[0], kTcpipPrefix)) {
    return ParseTcpip(tokens);
  }
  if (StartsWithNoCase(tokens[0], kSerialPrefix)) {
    return ParseSerial(tokens);
  }
  if (tokens.size() != 1) {
    return {};
  }

  size_t colon = address.rfind(':');
  if (colon == std::string_view::npos || colon == 0) {
    return {};
  }
  auto port = ParsePort(address.substr(colon + 1));
  if (!port.has_value()) {
    return {};
  }
  return ResourceName{ResourceKind::kTcpSocket, std::string(address.substr(0, colon)), *port, {}};
}

}  // namespace apsyn
