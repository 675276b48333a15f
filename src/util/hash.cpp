// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"
#include <array>
#include <openssl/sha.h>

namespace bridgerelay {
namespace util {

uint256 Sha256(std::span<const uint8_t> data) {
  uint256 out;
  SHA256(data.data(), data.size(), out.begin());
  return out;
}

uint256 Sha256Pair(const uint256 &left, const uint256 &right) {
  std::array<uint8_t, 64> buf;
  std::copy(left.begin(), left.end(), buf.begin());
  std::copy(right.begin(), right.end(), buf.begin() + 32);
  return Sha256(buf);
}

} // namespace util
} // namespace bridgerelay
