// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace bridgerelay {
namespace chain {

// Transport, HTTP, JSON-RPC or decode failure talking to a chain endpoint
class ChainClientError : public std::runtime_error {
public:
  explicit ChainClientError(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * ChainClient - read-only view of one chain endpoint
 *
 * Every call may throw ChainClientError. Failures are ordinary and
 * recoverable; callers abandon the current cycle and retry on the next tick.
 */
class ChainClient {
public:
  virtual ~ChainClient() = default;

  // Latest block number known to the endpoint
  virtual uint64_t GetBlockNumber() = 0;

  // Headers first..last inclusive, ascending, contiguous
  virtual std::vector<Header> GetHeaders(uint64_t first, uint64_t last) = 0;

  // Last block of `bridged` accepted by the bridge contract at `bridge`
  virtual uint64_t GetLastRelayedBlock(const ChainId &bridge,
                                       const ChainId &bridged) = 0;

  // Current proposer of the bridge contract at `bridge`
  virtual Address GetProposer(const ChainId &bridge) = 0;
};

} // namespace chain
} // namespace bridgerelay
