// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace bridgerelay {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr char kHexChars[] = "0123456789abcdef";

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (uint8_t byte : m_data) {
    out.push_back(kHexChars[byte >> 4]);
    out.push_back(kHexChars[byte & 0x0f]);
  }
  return out;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return "0x" + GetHex();
}

template <unsigned int BITS>
std::optional<base_blob<BITS>> base_blob<BITS>::FromHex(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return std::nullopt;
  }

  base_blob<BITS> out;
  for (int i = 0; i < WIDTH; ++i) {
    int hi = HexDigit(str[2 * i]);
    int lo = HexDigit(str[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.m_data[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

template class base_blob<160>;
template class base_blob<256>;

const uint256 uint256::ZERO{};

} // namespace bridgerelay
