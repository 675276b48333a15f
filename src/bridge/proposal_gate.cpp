// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/proposal_gate.hpp"
#include <bit>

namespace bridgerelay {
namespace bridge {

uint64_t LargestPowerOfTwo(uint64_t n) {
  if (n == 0) {
    return 0;
  }
  return std::bit_floor(n);
}

ProposalGate::ProposalGate(const BridgeLinkRegistry &links,
                           const chain::HeaderStore &store,
                           uint64_t threshold, util::LoggerPtr logger)
    : links_(links), store_(store), threshold_(threshold),
      logger_(util::OrNullLogger(std::move(logger))) {}

ProposalDecision ProposalGate::TryPropose(const ChainId &query,
                                          const ChainId &bridged,
                                          const Address &local) const {
  auto link = links_.Get(query, bridged);
  if (!link) {
    return NotEligible{"bridge state unknown"};
  }
  if (link->proposer != local) {
    return NotEligible{"not the proposer"};
  }

  uint64_t highest = store_.HighestStored(query);
  if (highest < link->last_block) {
    return NotEligible{"headers behind bridge"};
  }
  uint64_t pending = highest - link->last_block;
  if (pending < threshold_) {
    return NotEligible{"only " + std::to_string(pending) + " new headers"};
  }

  uint64_t span = LargestPowerOfTwo(pending - 1);
  if (span == 0) {
    return NotEligible{"empty range"};
  }

  ProposalRange range;
  range.chain = query;
  range.start_block = link->last_block + 1;
  range.end_block = link->last_block + 1 + span;

  logger_->debug("Eligible to propose {} blocks {}..{}", query.ToString(),
                 range.start_block, range.end_block);
  return Eligible{range};
}

} // namespace bridge
} // namespace bridgerelay
