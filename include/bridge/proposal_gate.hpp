// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/bridge_link.hpp"
#include "chain/header_store.hpp"
#include "util/logging.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace bridgerelay {
namespace bridge {

// Header range [start_block, end_block) of one chain
struct ProposalRange {
  ChainId chain;
  uint64_t start_block{0};
  uint64_t end_block{0};

  uint64_t Size() const { return end_block - start_block; }

  friend bool operator==(const ProposalRange &a, const ProposalRange &b) {
    return a.chain == b.chain && a.start_block == b.start_block &&
           a.end_block == b.end_block;
  }
};

// Commitment broadcast to peers for co-signing
struct ProposalMessage {
  ChainId chain;
  uint64_t start_block{0};
  uint64_t end_block{0};
  uint256 merkle_root;
  Address proposer;
};

struct NotEligible {
  std::string reason;
};

struct Eligible {
  ProposalRange range;
};

using ProposalDecision = std::variant<NotEligible, Eligible>;

// Largest power of two <= n (0 for n == 0)
uint64_t LargestPowerOfTwo(uint64_t n);

/**
 * ProposalGate - may this node propose, and over which range
 *
 * Eligible only when the bridge names `local` as proposer and at least
 * `threshold` headers past the bridge's last block are stored. The range
 * then starts right after the last block and spans
 * LargestPowerOfTwo(highest - last - 1) headers, so it never reaches past
 * HighestStored().
 *
 * Reads only; never blocks on I/O.
 */
class ProposalGate {
public:
  static constexpr uint64_t MIN_THRESHOLD = 2;

  ProposalGate(const BridgeLinkRegistry &links,
               const chain::HeaderStore &store, uint64_t threshold,
               util::LoggerPtr logger);

  ProposalDecision TryPropose(const ChainId &query, const ChainId &bridged,
                              const Address &local) const;

private:
  const BridgeLinkRegistry &links_;
  const chain::HeaderStore &store_;
  uint64_t threshold_;
  util::LoggerPtr logger_;
};

} // namespace bridge
} // namespace bridgerelay
