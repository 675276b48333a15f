#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of configuration values, peer endpoints and JSON-RPC
   quantities with validation
 - Centralized input validation so malformed config or RPC replies never
   crash the relay

 Key functions:
 - SafeParseUint64: unsigned decimal integers
 - SafeParsePort: port number (1-65535)
 - ParseHexQuantity: JSON-RPC "0x..." quantity to uint64
 - ParseBridgeIndex: "<addrA>_<addrB>" bridge pair identifier
 - SplitHostPort: "host:port" peer endpoint

 All functions return std::nullopt on any error and never throw.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "util/uint.hpp"

namespace bridgerelay {
namespace util {

/**
 * Parse unsigned decimal string. Rejects signs, whitespace and overflow.
 */
std::optional<uint64_t> SafeParseUint64(const std::string &str);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("8000") -> 8000
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

/**
 * Parse a JSON-RPC quantity ("0x" followed by 1-16 hex digits)
 *
 * Examples:
 *   ParseHexQuantity("0x0") -> 0
 *   ParseHexQuantity("0x1b4") -> 436
 *   ParseHexQuantity("1b4") -> std::nullopt (missing prefix)
 */
std::optional<uint64_t> ParseHexQuantity(std::string_view str);

/**
 * Format a uint64 as a JSON-RPC quantity ("0x" + minimal lowercase hex)
 */
std::string FormatHexQuantity(uint64_t value);

// 20-byte hex address, optional 0x prefix
std::optional<uint160> SafeParseAddress(const std::string &str);

// 32-byte hex hash, optional 0x prefix
std::optional<uint256> SafeParseHash(const std::string &str);

/**
 * Parse the bridge index "<addrA>_<addrB>" into its two chain ids.
 * Both parts must be valid addresses and must differ.
 */
std::optional<std::pair<uint160, uint160>>
ParseBridgeIndex(const std::string &str);

/**
 * Split "host:port" into its parts. The host must be non-empty and the
 * port valid. An IPv6 host is accepted in brackets ("[::1]:8000").
 */
std::optional<std::pair<std::string, uint16_t>>
SplitHostPort(const std::string &str);

} // namespace util
} // namespace bridgerelay
