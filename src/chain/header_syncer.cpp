// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/header_syncer.hpp"
#include <algorithm>

namespace bridgerelay {
namespace chain {

HeaderSyncer::HeaderSyncer(HeaderStore &store, util::LoggerPtr logger,
                           size_t max_batches)
    : store_(store), logger_(util::OrNullLogger(std::move(logger))),
      max_batches_(max_batches) {}

bool HeaderSyncer::Sync(const ChainId &chain, ChainClient &client,
                        RelayState &state,
                        const std::function<bool()> &keep_going,
                        bool *caught_up) {
  if (caught_up) {
    *caught_up = false;
  }

  // A full tail means a batch that should already have been flushed
  if (store_.TailCache(chain).size() >= HeaderStore::BATCH_SIZE) {
    logger_->warn("Tail cache for {} holds a full batch, reloading",
                  chain.ToString());
    if (!store_.ResetTailCache(chain, state)) {
      return false;
    }
  }

  uint64_t current = 0;
  try {
    current = client.GetBlockNumber();
  } catch (const ChainClientError &e) {
    return state.Fail(RelayState::Code::SYNC_ERROR, "block-number-failed",
                      e.what());
  }

  uint64_t stored = store_.HighestStored(chain);
  if (current <= stored) {
    logger_->trace("{} up to date at block {}", chain.ToString(), stored);
    if (caught_up) {
      *caught_up = true;
    }
    return true;
  }

  logger_->debug("Syncing {} from block {} to {}", chain.ToString(),
                 stored + 1, current);

  uint64_t next = stored + 1;
  size_t batches = 0;
  while (next <= current) {
    if ((max_batches_ > 0 && batches >= max_batches_) ||
        (keep_going && !keep_going())) {
      logger_->debug("{} sync paused at block {} of {}", chain.ToString(),
                     next - 1, current);
      return true;
    }

    uint64_t last = std::min<uint64_t>(current, next + HeaderStore::BATCH_SIZE - 1);

    std::vector<Header> headers;
    try {
      headers = client.GetHeaders(next, last);
    } catch (const ChainClientError &e) {
      return state.Fail(RelayState::Code::SYNC_ERROR, "get-headers-failed",
                        "blocks " + std::to_string(next) + ".." +
                            std::to_string(last) + ": " + e.what());
    }

    if (headers.size() != last - next + 1) {
      return state.Fail(RelayState::Code::SYNC_ERROR, "short-header-reply",
                        "asked for " + std::to_string(last - next + 1) +
                            ", got " + std::to_string(headers.size()));
    }
    if (!store_.Append(chain, headers, state)) {
      return false;
    }
    next = last + 1;
    ++batches;
  }

  logger_->info("{} synced to block {}", chain.ToString(), current);
  if (caught_up) {
    *caught_up = true;
  }
  return true;
}

} // namespace chain
} // namespace bridgerelay
