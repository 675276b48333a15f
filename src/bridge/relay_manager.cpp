// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/relay_manager.hpp"
#include "chain/merkle.hpp"
#include "network/peer_message.hpp"

namespace bridgerelay {
namespace bridge {

RelayManager::RelayManager(chain::HeaderStore &store,
                           BridgeLinkRegistry &links, const ProposalGate &gate,
                           network::Broadcaster &broadcaster,
                           const Config &config, util::LoggerPtr sync_logger,
                           util::LoggerPtr bridge_logger)
    : store_(store), syncer_(store, sync_logger, config.max_batches_per_tick),
      links_(links), gate_(gate), broadcaster_(broadcaster), config_(config),
      sync_logger_(util::OrNullLogger(std::move(sync_logger))),
      logger_(util::OrNullLogger(std::move(bridge_logger))) {}

RelayManager::~RelayManager() { Stop(); }

size_t RelayManager::AddChain(const ChainId &chain, const ChainId &counterpart,
                              chain::ChainClient &client) {
  auto task = std::make_unique<ChainTask>();
  task->chain = chain;
  task->counterpart = counterpart;
  task->client = &client;
  chains_.push_back(std::move(task));
  return chains_.size() - 1;
}

void RelayManager::Start() {
  if (running_.exchange(true)) {
    return;
  }
  logger_->info("Starting relay loop for {} chains (query delay {} ms)",
                chains_.size(), config_.query_delay.count());
  for (auto &task : chains_) {
    task->io.restart();
    schedule_next_tick(*task, std::chrono::milliseconds(0));
    task->thread = std::thread([io = &task->io]() { io->run(); });
  }
}

void RelayManager::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // A waiting timer is cancelled; a running tick returns at its next chunk
  // boundary and does not re-arm. Each io_context then runs out of work.
  for (auto &task : chains_) {
    boost::asio::post(task->io, [timer = &task->timer]() { timer->cancel(); });
  }
  for (auto &task : chains_) {
    if (task->thread.joinable()) {
      task->thread.join();
    }
  }
  logger_->info("Relay loop stopped");
}

void RelayManager::schedule_next_tick(ChainTask &task,
                                      std::chrono::milliseconds delay) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  task.timer.expires_after(delay);
  task.timer.async_wait([this, &task](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    CycleResult result = run_tick(
        task, [this]() { return running_.load(std::memory_order_acquire); });
    sync_logger_->trace(
        "Tick for {} done (synced={}, caught_up={}, refreshed={}, proposed={})",
        task.chain.ToString(), result.synced, result.caught_up,
        result.refreshed, result.proposal.has_value());
    // Still behind the tip: continue without waiting a full delay
    bool behind = result.synced && !result.caught_up;
    schedule_next_tick(task, behind ? std::chrono::milliseconds(0)
                                    : config_.query_delay);
  });
}

CycleResult RelayManager::RunCycle(size_t index) {
  return run_tick(*chains_.at(index), nullptr);
}

CycleResult RelayManager::run_tick(ChainTask &task,
                                   const std::function<bool()> &keep_going) {
  CycleResult result;

  chain::RelayState sync_state;
  result.synced = syncer_.Sync(task.chain, *task.client, sync_state,
                               keep_going, &result.caught_up);
  if (!result.synced) {
    sync_logger_->warn("Sync of {} failed: {}", task.chain.ToString(),
                       sync_state.ToString());
  }
  if (keep_going && !keep_going()) {
    return result;
  }

  chain::RelayState refresh_state;
  result.refreshed =
      links_.Refresh(task.chain, task.counterpart, *task.client, refresh_state);
  if (!result.refreshed) {
    logger_->warn("Bridge refresh {} -> {} failed: {}", task.chain.ToString(),
                  task.counterpart.ToString(), refresh_state.ToString());
  }

  result.proposal = attempt_proposal(task);
  return result;
}

std::optional<ProposalMessage> RelayManager::attempt_proposal(ChainTask &task) {
  ProposalDecision decision =
      gate_.TryPropose(task.chain, task.counterpart, config_.local_address);
  if (auto *no = std::get_if<NotEligible>(&decision)) {
    logger_->trace("No proposal for {}: {}", task.chain.ToString(), no->reason);
    return std::nullopt;
  }
  const ProposalRange &range = std::get<Eligible>(decision).range;

  if (task.last_proposed && *task.last_proposed == range) {
    logger_->trace("Range {}..{} of {} already proposed", range.start_block,
                   range.end_block, range.chain.ToString());
    return std::nullopt;
  }

  chain::RelayState state;
  std::vector<chain::Header> headers;
  uint64_t highest = 0;
  if (!store_.Load(range.chain, range.start_block, range.end_block, headers,
                   highest, state)) {
    logger_->warn("Proposal for {} blocks {}..{} abandoned: {}",
                  range.chain.ToString(), range.start_block, range.end_block,
                  state.ToString());
    return std::nullopt;
  }

  auto root = chain::ComputeHeaderRoot(headers, state);
  if (!root) {
    logger_->error("Cannot compute header root for {}: {}",
                   range.chain.ToString(), state.ToString());
    return std::nullopt;
  }

  ProposalMessage msg;
  msg.chain = range.chain;
  msg.start_block = range.start_block;
  msg.end_block = range.end_block;
  msg.merkle_root = *root;
  msg.proposer = config_.local_address;

  logger_->info("Proposing {} blocks {}..{} with root {}", msg.chain.ToString(),
                msg.start_block, msg.end_block, msg.merkle_root.ToString());
  broadcaster_.Broadcast(
      network::EncodePeerMessage(network::SignatureRequest{msg}));
  task.last_proposed = range;
  return msg;
}

} // namespace bridge
} // namespace bridgerelay
