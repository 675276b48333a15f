// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace bridgerelay {
namespace network {

// PeerDirectory - the configured "host:port" peers (no discovery)
class PeerDirectory {
public:
  explicit PeerDirectory(std::vector<std::string> peers = {});

  std::vector<std::string> GetPeers() const;

  // Ignores duplicates; returns false when `peer` was already known
  bool Add(const std::string &peer);

  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> peers_;
};

} // namespace network
} // namespace bridgerelay
