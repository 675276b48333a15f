// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/bridge_link.hpp"
#include "bridge/proposal_gate.hpp"
#include "chain/chain_client.hpp"
#include "chain/header_store.hpp"
#include "chain/header_syncer.hpp"
#include "network/broadcaster.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace bridgerelay {
namespace bridge {

// Outcome of one chain tick
struct CycleResult {
  bool synced{false};
  // Store reached the endpoint's tip during this tick
  bool caught_up{false};
  bool refreshed{false};
  // Set when a proposal was computed and broadcast this tick
  std::optional<ProposalMessage> proposal;
};

/**
 * RelayManager - per-chain relay loop
 *
 * Each registered chain gets its own io_context, timer and thread, apart
 * from the io_context that serves peers, because a tick blocks on chain
 * RPC calls. One tick:
 *   1. HeaderSyncer::Sync(chain), at most max_batches_per_tick chunks
 *   2. BridgeLinkRegistry::Refresh(chain, counterpart)
 *   3. proposal attempt for (chain, counterpart): gate -> load -> Merkle
 *      root -> SIGREQ broadcast
 * The next tick is armed only after the current one returns, so ticks for
 * one chain never overlap and HeaderStore sees a single writer per chain.
 * A tick that stopped short of the tip re-arms immediately; otherwise it
 * waits query_delay. Step failures are logged and the rest of the tick
 * still runs.
 *
 * The first tick runs as soon as Start() is called. Stop() waits for a
 * running tick, which stops syncing at the next chunk boundary.
 */
class RelayManager {
public:
  struct Config {
    Address local_address;
    std::chrono::milliseconds query_delay{std::chrono::seconds(10)};
    size_t max_batches_per_tick{10};
  };

  RelayManager(chain::HeaderStore &store, BridgeLinkRegistry &links,
               const ProposalGate &gate, network::Broadcaster &broadcaster,
               const Config &config, util::LoggerPtr sync_logger,
               util::LoggerPtr bridge_logger);
  ~RelayManager();

  RelayManager(const RelayManager &) = delete;
  RelayManager &operator=(const RelayManager &) = delete;

  // Register a chain before Start(). `client` must outlive the manager.
  // Returns the chain's index.
  size_t AddChain(const ChainId &chain, const ChainId &counterpart,
                  chain::ChainClient &client);

  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Run one tick for chain `index` on the calling thread. Must not be called
  // while the scheduled loop is running.
  CycleResult RunCycle(size_t index);

  size_t ChainCount() const { return chains_.size(); }

private:
  struct ChainTask {
    ChainId chain;
    ChainId counterpart;
    chain::ChainClient *client{nullptr};
    // Runs only this chain's ticks, on `thread`
    boost::asio::io_context io;
    boost::asio::steady_timer timer{io};
    std::thread thread;
    std::optional<ProposalRange> last_proposed;
  };

  void schedule_next_tick(ChainTask &task, std::chrono::milliseconds delay);

  CycleResult run_tick(ChainTask &task,
                       const std::function<bool()> &keep_going);

  std::optional<ProposalMessage> attempt_proposal(ChainTask &task);

  chain::HeaderStore &store_;
  chain::HeaderSyncer syncer_;
  BridgeLinkRegistry &links_;
  const ProposalGate &gate_;
  network::Broadcaster &broadcaster_;
  Config config_;
  util::LoggerPtr sync_logger_;
  util::LoggerPtr logger_;

  std::vector<std::unique_ptr<ChainTask>> chains_;
  std::atomic<bool> running_{false};
};

} // namespace bridge
} // namespace bridgerelay
