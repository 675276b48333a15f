// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_client.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bridgerelay {
namespace chain {

// Parsed "http://host[:port][/path]" endpoint
struct HttpEndpoint {
  std::string host;
  std::string port{"80"};
  std::string target{"/"};

  static std::optional<HttpEndpoint> Parse(const std::string &url);
};

/**
 * Ethereum JSON-RPC chain client over HTTP/1.1 (Boost.Beast)
 *
 * Each call opens a fresh connection and runs on its own io_context, so the
 * client can be used from any thread. Every call is bounded by `timeout`;
 * on expiry it throws ChainClientError.
 */
class RpcChainClient : public ChainClient {
public:
  // Bridge contract selectors
  static constexpr const char *GET_LAST_BLOCK_SELECTOR = "4929dfa1"; // getLastBlock(address)
  static constexpr const char *GET_PROPOSER_SELECTOR = "e9790d02";   // getProposer()

  RpcChainClient(HttpEndpoint endpoint, std::chrono::milliseconds timeout,
                 util::LoggerPtr logger);

  uint64_t GetBlockNumber() override;
  std::vector<Header> GetHeaders(uint64_t first, uint64_t last) override;
  uint64_t GetLastRelayedBlock(const ChainId &bridge,
                               const ChainId &bridged) override;
  Address GetProposer(const ChainId &bridge) override;

  // Decode one eth_getBlockByNumber result object
  static Header ParseBlock(const nlohmann::json &block);

private:
  // Single call, returns the "result" member
  nlohmann::json Call(const std::string &method, nlohmann::json params);

  // eth_call against `to`, returns the first 32-byte return word
  uint256 EthCall(const ChainId &to, const std::string &data);

  // POST one JSON body, return the parsed JSON reply
  nlohmann::json Post(const nlohmann::json &body);

  HttpEndpoint endpoint_;
  std::chrono::milliseconds timeout_;
  util::LoggerPtr logger_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace chain
} // namespace bridgerelay
