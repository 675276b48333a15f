// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/bridge_link.hpp"

namespace bridgerelay {
namespace bridge {

BridgeLinkRegistry::BridgeLinkRegistry(util::LoggerPtr logger)
    : logger_(util::OrNullLogger(std::move(logger))) {}

bool BridgeLinkRegistry::Refresh(const ChainId &query, const ChainId &bridged,
                                 chain::ChainClient &client,
                                 chain::RelayState &state) {
  BridgeLink fresh;
  try {
    fresh.last_block = client.GetLastRelayedBlock(query, bridged);
    fresh.proposer = client.GetProposer(query);
  } catch (const chain::ChainClientError &e) {
    return state.Fail(chain::RelayState::Code::QUERY_ERROR,
                      "bridge-query-failed", e.what());
  }

  Update(BridgeKey{query, bridged}, [&](BridgeLink &link) { link = fresh; },
         true);
  logger_->debug("Bridge {} -> {}: last block {}, proposer {}",
                 query.ToString(), bridged.ToString(), fresh.last_block,
                 fresh.proposer.ToString());
  return true;
}

bool BridgeLinkRegistry::ApplyProposerAnnouncement(const ChainId &query,
                                                   const ChainId &bridged,
                                                   const Address &proposer) {
  if (!Update(BridgeKey{query, bridged},
              [&](BridgeLink &link) { link.proposer = proposer; }, false)) {
    logger_->debug("Ignoring proposer announcement for unknown bridge {} -> {}",
                   query.ToString(), bridged.ToString());
    return false;
  }
  logger_->info("Proposer for {} -> {} announced as {}", query.ToString(),
                bridged.ToString(), proposer.ToString());
  return true;
}

bool BridgeLinkRegistry::Update(const BridgeKey &key,
                                const std::function<void(BridgeLink &)> &mutate,
                                bool create) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = links_.find(key);
  if (it == links_.end()) {
    if (!create) {
      return false;
    }
    it = links_.emplace(key, BridgeLink{}).first;
  }
  BridgeLink link = it->second;
  mutate(link);
  it->second = link;
  return true;
}

std::optional<BridgeLink> BridgeLinkRegistry::Get(const ChainId &query,
                                                  const ChainId &bridged) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = links_.find(BridgeKey{query, bridged});
  if (it == links_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t BridgeLinkRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return links_.size();
}

} // namespace bridge
} // namespace bridgerelay
