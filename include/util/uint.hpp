// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bridgerelay {

/**
 * Fixed-size opaque byte blob (hashes, addresses).
 *
 * Unlike Bitcoin-style blobs, the hex form is the natural byte order used by
 * Ethereum JSON-RPC: byte 0 is printed first. GetHex() has no prefix,
 * ToString() adds "0x".
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob only supports whole bytes");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  constexpr explicit base_blob(std::span<const uint8_t> bytes) : m_data() {
    std::copy_n(bytes.begin(), std::min<size_t>(bytes.size(), WIDTH),
                m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  constexpr int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  // Lowercase hex, natural byte order, no prefix
  std::string GetHex() const;
  // "0x" + GetHex()
  std::string ToString() const;

  /**
   * Strict hex parse. Accepts an optional "0x"/"0X" prefix and requires
   * exactly 2 * WIDTH hex digits.
   */
  static std::optional<base_blob> FromHex(std::string_view str);

  constexpr const uint8_t *data() const { return m_data.data(); }
  constexpr uint8_t *data() { return m_data.data(); }

  constexpr uint8_t *begin() { return m_data.data(); }
  constexpr uint8_t *end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t *begin() const { return m_data.data(); }
  constexpr const uint8_t *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 160-bit blob: contract and wallet addresses. */
class uint160 : public base_blob<160> {
public:
  constexpr uint160() = default;
  constexpr uint160(const base_blob<160> &b) : base_blob<160>(b) {}
  constexpr explicit uint160(std::span<const uint8_t> bytes)
      : base_blob<160>(bytes) {}

  static std::optional<uint160> FromHex(std::string_view str) {
    auto b = base_blob<160>::FromHex(str);
    if (!b) return std::nullopt;
    return uint160(*b);
  }
};

/** 256-bit blob: header hashes, trie roots, Merkle roots. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr uint256(const base_blob<256> &b) : base_blob<256>(b) {}
  constexpr explicit uint256(std::span<const uint8_t> bytes)
      : base_blob<256>(bytes) {}

  static std::optional<uint256> FromHex(std::string_view str) {
    auto b = base_blob<256>::FromHex(str);
    if (!b) return std::nullopt;
    return uint256(*b);
  }

  static const uint256 ZERO;
};

} // namespace bridgerelay
