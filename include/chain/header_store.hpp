// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header.hpp"
#include "chain/relay_state.hpp"
#include "util/logging.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace bridgerelay {
namespace chain {

// HeaderStore - append-only per-chain header logs with an in-memory tail
//
// File layout (<datadir>/<0x chain id>/headers):
//   one line per batch of BATCH_SIZE records, '\n' terminated, records
//   separated by ','. The last line may hold fewer records and has no
//   terminator; it mirrors the tail cache.
//
// Complete lines are never rewritten. Each flush truncates the file to the
// end of the last complete line and writes the new lines plus the new tail.
//
// Numbering starts at block 1, so HighestStored() is also the record count.
//
// THREAD SAFETY: every public method is safe to call concurrently. Calls for
// one chain are serialized by that chain's mutex; different chains do not
// contend.
class HeaderStore {
public:
  static constexpr size_t BATCH_SIZE = 100;

  HeaderStore(std::filesystem::path datadir, util::LoggerPtr logger);
  ~HeaderStore();

  HeaderStore(const HeaderStore &) = delete;
  HeaderStore &operator=(const HeaderStore &) = delete;

  // Open (or create) the log for `chain` and rebuild its tail cache from the
  // trailing partial line. Fails with IO_ERROR on an unreadable or corrupt
  // file. Opening an already open chain is a no-op.
  bool Open(const ChainId &chain, RelayState &state);

  // Append headers in ascending order. Headers at or below HighestStored()
  // are skipped, so overlapping input is harmless. The first new header must
  // be HighestStored() + 1 and the rest contiguous (SYNC_ERROR otherwise).
  // A failed write leaves the in-memory state untouched (IO_ERROR).
  bool Append(const ChainId &chain, const std::vector<Header> &headers,
              RelayState &state);

  // Load headers in [start, end). Fails with NOT_SYNCED if end exceeds
  // HighestStored(), INVALID_RANGE if start > end. start 0 is read as 1.
  // `highest` receives HighestStored() at the time of the read.
  bool Load(const ChainId &chain, uint64_t start, uint64_t end,
            std::vector<Header> &out, uint64_t &highest,
            RelayState &state) const;

  // 0 for unknown chains
  uint64_t HighestStored(const ChainId &chain) const;

  std::vector<Header> TailCache(const ChainId &chain) const;

  // Drop the in-memory tail and rebuild it from disk
  bool ResetTailCache(const ChainId &chain, RelayState &state);

  std::filesystem::path LogPath(const ChainId &chain) const;

private:
  struct ChainLog {
    mutable std::mutex mutex;
    std::filesystem::path path;
    uint64_t highest{0};
    // Bytes up to and including the last '\n'
    uint64_t complete_bytes{0};
    // Byte offset of each complete line
    std::vector<uint64_t> line_offsets;
    std::vector<Header> tail;
  };

  ChainLog *Find(const ChainId &chain) const;

  // Scan the file into `log` (caller holds log.mutex)
  bool ReadLog(ChainLog &log, RelayState &state) const;

  std::filesystem::path datadir_;
  util::LoggerPtr logger_;

  mutable std::mutex chains_mutex_;
  std::map<ChainId, std::unique_ptr<ChainLog>> chains_;
};

} // namespace chain
} // namespace bridgerelay
