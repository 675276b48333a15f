// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_client.hpp"
#include "chain/header.hpp"
#include "chain/relay_state.hpp"
#include "util/logging.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace bridgerelay {
namespace bridge {

using chain::Address;
using chain::ChainId;

// One direction of a bridge: the contract on `query` relaying `bridged`
struct BridgeKey {
  ChainId query;
  ChainId bridged;

  friend bool operator==(const BridgeKey &a, const BridgeKey &b) {
    return a.query == b.query && a.bridged == b.bridged;
  }
  friend bool operator<(const BridgeKey &a, const BridgeKey &b) {
    if (a.query != b.query) {
      return a.query < b.query;
    }
    return a.bridged < b.bridged;
  }
};

struct BridgeLink {
  uint64_t last_block{0};
  Address proposer{};
};

/**
 * BridgeLinkRegistry - latest known state of each bridge direction
 *
 * Snapshots are replaced whole under a mutex, so readers always see either
 * the old or the new record. Both writers (chain refresh and proposer
 * announcements from peers) go through Update(); the latest write wins.
 */
class BridgeLinkRegistry {
public:
  explicit BridgeLinkRegistry(util::LoggerPtr logger);

  // Read last relayed block and proposer from the contract on `query`.
  // Commits only when both reads succeed; otherwise the previous snapshot
  // stays and the state holds QUERY_ERROR.
  bool Refresh(const ChainId &query, const ChainId &bridged,
               chain::ChainClient &client, chain::RelayState &state);

  // Proposer change announced by a peer. Only a link created by Refresh()
  // is updated, keeping its last block; an unknown pair is ignored and
  // false is returned.
  bool ApplyProposerAnnouncement(const ChainId &query, const ChainId &bridged,
                                 const Address &proposer);

  std::optional<BridgeLink> Get(const ChainId &query,
                                const ChainId &bridged) const;

  size_t Size() const;

private:
  // Single write path: read-modify-write of one record under mutex_.
  // A missing record is created only when `create` is set.
  bool Update(const BridgeKey &key,
              const std::function<void(BridgeLink &)> &mutate, bool create);

  util::LoggerPtr logger_;
  mutable std::mutex mutex_;
  std::map<BridgeKey, BridgeLink> links_;
};

} // namespace bridge
} // namespace bridgerelay
