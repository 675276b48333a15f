// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/signature_store.hpp"

namespace bridgerelay {
namespace network {

void SignatureStore::AddRequest(const bridge::ProposalMessage &proposal) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_.size() >= MAX_PENDING_REQUESTS) {
    requests_.erase(requests_.begin());
  }
  requests_.push_back(proposal);
}

std::vector<bridge::ProposalMessage> SignatureStore::TakeRequests() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<bridge::ProposalMessage> out;
  out.swap(requests_);
  return out;
}

size_t SignatureStore::PendingRequestCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

bool SignatureStore::AddSignature(const uint256 &merkle_root,
                                  const StoredSignature &sig) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = signatures_.find(merkle_root);
  if (it == signatures_.end()) {
    if (signatures_.size() >= MAX_SIGNATURE_ROOTS) {
      signatures_.erase(root_order_.front());
      root_order_.pop_front();
    }
    it = signatures_.emplace(merkle_root, std::vector<StoredSignature>{}).first;
    root_order_.push_back(merkle_root);
  }

  auto &list = it->second;
  for (auto &existing : list) {
    if (existing.signer == sig.signer) {
      existing = sig;
      return true;
    }
  }
  if (list.size() >= MAX_SIGNERS_PER_ROOT) {
    return false;
  }
  list.push_back(sig);
  return true;
}

size_t SignatureStore::RootCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signatures_.size();
}

std::vector<StoredSignature>
SignatureStore::GetSignatures(const uint256 &merkle_root) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = signatures_.find(merkle_root);
  if (it == signatures_.end()) {
    return {};
  }
  return it->second;
}

} // namespace network
} // namespace bridgerelay
