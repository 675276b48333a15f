// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_directory.hpp"
#include <algorithm>

namespace bridgerelay {
namespace network {

PeerDirectory::PeerDirectory(std::vector<std::string> peers) {
  for (auto &p : peers) {
    Add(p);
  }
}

std::vector<std::string> PeerDirectory::GetPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

bool PeerDirectory::Add(const std::string &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(peers_.begin(), peers_.end(), peer) != peers_.end()) {
    return false;
  }
  peers_.push_back(peer);
  return true;
}

size_t PeerDirectory::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

} // namespace network
} // namespace bridgerelay
