// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/proposal_gate.hpp"
#include "util/uint.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace bridgerelay {
namespace network {

struct StoredSignature {
  chain::Address signer;
  std::string signature;
};

/**
 * SignatureStore - hand-off point between the peer protocol and the wallet
 *
 * Keeps co-signing requests until the wallet component takes them, and
 * signatures received from peers grouped by Merkle root. Nothing here is
 * verified; a repeated signer for the same root replaces its old entry.
 * Roots are kept in arrival order and the oldest is evicted past
 * MAX_SIGNATURE_ROOTS.
 */
class SignatureStore {
public:
  // Bound on queued requests; the oldest is dropped past this
  static constexpr size_t MAX_PENDING_REQUESTS = 1024;
  static constexpr size_t MAX_SIGNATURE_ROOTS = 256;
  // New signers for a full root are refused; known signers may still replace
  static constexpr size_t MAX_SIGNERS_PER_ROOT = 128;

  void AddRequest(const bridge::ProposalMessage &proposal);

  // Remove and return all queued requests
  std::vector<bridge::ProposalMessage> TakeRequests();

  size_t PendingRequestCount() const;

  // Returns false when the signature was dropped
  bool AddSignature(const uint256 &merkle_root, const StoredSignature &sig);

  size_t RootCount() const;

  std::vector<StoredSignature> GetSignatures(const uint256 &merkle_root) const;

private:
  mutable std::mutex mutex_;
  std::vector<bridge::ProposalMessage> requests_;
  std::map<uint256, std::vector<StoredSignature>> signatures_;
  std::deque<uint256> root_order_;
};

} // namespace network
} // namespace bridgerelay
