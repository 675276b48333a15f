// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_client.hpp"
#include "chain/header_store.hpp"
#include "chain/relay_state.hpp"
#include "util/logging.hpp"
#include <cstddef>
#include <functional>

namespace bridgerelay {
namespace chain {

// HeaderSyncer - moves a chain's HeaderStore up to the endpoint's tip
//
// One Sync() call is one tick. Headers are fetched in BATCH_SIZE chunks and
// appended after each chunk, so an interrupted sync keeps its progress.
// Callers must not run two Sync() calls for the same chain concurrently.
//
// With max_batches > 0 a call fetches at most that many chunks and returns;
// the next call continues from the stored height.
class HeaderSyncer {
public:
  HeaderSyncer(HeaderStore &store, util::LoggerPtr logger,
               size_t max_batches = 0);

  // Returns false with SYNC_ERROR (client failure or rejected append) or
  // IO_ERROR (log write failure). Headers stored before the failure stay
  // stored.
  //
  // `keep_going` is checked before every chunk; returning false ends the
  // call early (not an error). `caught_up` is set to true only when the
  // store reached the endpoint's tip.
  bool Sync(const ChainId &chain, ChainClient &client, RelayState &state,
            const std::function<bool()> &keep_going = nullptr,
            bool *caught_up = nullptr);

private:
  HeaderStore &store_;
  util::LoggerPtr logger_;
  size_t max_batches_;
};

} // namespace chain
} // namespace bridgerelay
