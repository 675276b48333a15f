// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header.hpp"
#include "chain/relay_state.hpp"
#include "util/uint.hpp"
#include <optional>
#include <vector>

namespace bridgerelay {
namespace chain {

/**
 * Binary Merkle root over an ordered header sequence
 *
 * Leaves are Header::GetCommitmentHash(). Interior nodes are
 * SHA-256(left || right); an odd level duplicates its last node. A single
 * header's root is its own leaf hash.
 *
 * Pure and deterministic. Fails with EMPTY_RANGE for an empty sequence.
 */
std::optional<uint256> ComputeHeaderRoot(const std::vector<Header> &headers,
                                         RelayState &state);

// Same fold over precomputed leaves (leaves must be non-empty)
uint256 ComputeMerkleRoot(std::vector<uint256> leaves);

} // namespace chain
} // namespace bridgerelay
