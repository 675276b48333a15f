// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/merkle.hpp"
#include "util/hash.hpp"

namespace bridgerelay {
namespace chain {

uint256 ComputeMerkleRoot(std::vector<uint256> leaves) {
  if (leaves.empty()) {
    return uint256::ZERO;
  }

  std::vector<uint256> layer = std::move(leaves);
  while (layer.size() > 1) {
    std::vector<uint256> next;
    next.reserve((layer.size() + 1) / 2);
    for (size_t i = 0; i < layer.size(); i += 2) {
      const uint256 &left = layer[i];
      const uint256 &right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
      next.push_back(util::Sha256Pair(left, right));
    }
    layer = std::move(next);
  }
  return layer.front();
}

std::optional<uint256> ComputeHeaderRoot(const std::vector<Header> &headers,
                                         RelayState &state) {
  if (headers.empty()) {
    state.Fail(RelayState::Code::EMPTY_RANGE, "empty-range",
               "cannot commit to zero headers");
    return std::nullopt;
  }

  std::vector<uint256> leaves;
  leaves.reserve(headers.size());
  for (const auto &h : headers) {
    leaves.push_back(h.GetCommitmentHash());
  }
  return ComputeMerkleRoot(std::move(leaves));
}

} // namespace chain
} // namespace bridgerelay
