// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <span>

namespace bridgerelay {
namespace util {

// Single SHA-256 (OpenSSL libcrypto)
uint256 Sha256(std::span<const uint8_t> data);

// SHA-256 over left || right, used for interior Merkle nodes
uint256 Sha256Pair(const uint256 &left, const uint256 &right);

} // namespace util
} // namespace bridgerelay
