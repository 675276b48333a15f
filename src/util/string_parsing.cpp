#include "util/string_parsing.hpp"
#include <cctype>
#include <charconv>

namespace bridgerelay {
namespace util {

namespace {

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  int64_t value = 0;
  const char *first = str.data();
  const char *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);

  // Whole string must be consumed, no overflow
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

bool IsValidHex(std::string_view str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

} // namespace

std::optional<uint64_t> SafeParseUint64(const std::string &str) {
  if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  uint64_t value = 0;
  const char *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<uint64_t> ParseHexQuantity(std::string_view str) {
  if (str.size() < 3 || str[0] != '0' || (str[1] != 'x' && str[1] != 'X')) {
    return std::nullopt;
  }
  std::string_view digits = str.substr(2);
  if (digits.size() > 16 || !IsValidHex(digits)) {
    return std::nullopt;
  }

  uint64_t value = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

std::string FormatHexQuantity(uint64_t value) {
  char buf[17];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
  (void)ec; // 16 hex digits always fit
  return "0x" + std::string(buf, ptr);
}

std::optional<uint160> SafeParseAddress(const std::string &str) {
  return uint160::FromHex(str);
}

std::optional<uint256> SafeParseHash(const std::string &str) {
  return uint256::FromHex(str);
}

std::optional<std::pair<uint160, uint160>>
ParseBridgeIndex(const std::string &str) {
  auto sep = str.find('_');
  if (sep == std::string::npos || str.find('_', sep + 1) != std::string::npos) {
    return std::nullopt;
  }

  auto first = SafeParseAddress(str.substr(0, sep));
  auto second = SafeParseAddress(str.substr(sep + 1));
  if (!first || !second || *first == *second) {
    return std::nullopt;
  }
  return std::make_pair(*first, *second);
}

std::optional<std::pair<std::string, uint16_t>>
SplitHostPort(const std::string &str) {
  std::string host;
  std::string port;

  if (!str.empty() && str[0] == '[') {
    auto close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() ||
        str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port = str.substr(close + 2);
  } else {
    auto colon = str.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    port = str.substr(colon + 1);
    // Unbracketed IPv6 is ambiguous
    if (host.find(':') != std::string::npos) {
      return std::nullopt;
    }
  }

  if (host.empty()) {
    return std::nullopt;
  }
  auto parsed_port = SafeParsePort(port);
  if (!parsed_port) {
    return std::nullopt;
  }
  return std::make_pair(host, *parsed_port);
}

} // namespace util
} // namespace bridgerelay
