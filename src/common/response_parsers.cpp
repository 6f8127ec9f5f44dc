#include "common/response_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apsyn {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

// from_chars rejects a leading '+', which instruments do send
std::string_view StripPlus(std::string_view text) {
  if (text.size() > 1 && text.front() == '+') {
    text.remove_prefix(1);
  }
  return text;
}

}  // namespace

std::string ParseOnOff(std::string_view reply) {
  if (reply.starts_with('0')) {
    return "off";
  }
  if (reply.starts_with('1')) {
    return "on";
  }
  return std::string(reply);
}

std::string_view Trim(std::string_view text) {
  size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::string NormalizeToken(std::string_view reply) {
  std::string token(Trim(reply));
  std::transform(token.begin(), token.end(), token.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return token;
}

std::optional<double> ParseDouble(std::string_view reply) {
  std::string_view text = StripPlus(Trim(reply));
  if (text.empty()) {
    return {};
  }
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return {};
  }
  return value;
}

std::optional<int64_t> ParseInteger(std::string_view reply) {
  std::string_view text = StripPlus(Trim(reply));
  if (text.empty()) {
    return {};
  }
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return {};
  }
  return value;
}

}  // namespace apsyn
