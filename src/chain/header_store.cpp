// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/header_store.hpp"
#include "util/files.hpp"
#include <algorithm>
#include <fstream>
#include <string>
#include <string_view>

namespace bridgerelay {
namespace chain {

namespace {

constexpr char kRecordSeparator = ',';
constexpr char kLineTerminator = '\n';

// Split one line into records, decoding each. Empty line -> no records.
bool DecodeLine(std::string_view line, std::vector<Header> &out) {
  out.clear();
  if (line.empty()) {
    return true;
  }
  size_t start = 0;
  while (true) {
    size_t pos = line.find(kRecordSeparator, start);
    std::string_view field = pos == std::string_view::npos
                                 ? line.substr(start)
                                 : line.substr(start, pos - start);
    auto header = Header::DecodeRecord(field);
    if (!header) {
      return false;
    }
    out.push_back(*header);
    if (pos == std::string_view::npos) {
      return true;
    }
    start = pos + 1;
  }
}

void EncodeLine(std::vector<Header>::const_iterator first,
                std::vector<Header>::const_iterator last, std::string &out) {
  for (auto it = first; it != last; ++it) {
    if (it != first) {
      out += kRecordSeparator;
    }
    out += it->EncodeRecord();
  }
}

} // namespace

HeaderStore::HeaderStore(std::filesystem::path datadir, util::LoggerPtr logger)
    : datadir_(std::move(datadir)), logger_(util::OrNullLogger(std::move(logger))) {}

HeaderStore::~HeaderStore() = default;

std::filesystem::path HeaderStore::LogPath(const ChainId &chain) const {
  return datadir_ / chain.ToString() / "headers";
}

HeaderStore::ChainLog *HeaderStore::Find(const ChainId &chain) const {
  std::lock_guard<std::mutex> lock(chains_mutex_);
  auto it = chains_.find(chain);
  return it == chains_.end() ? nullptr : it->second.get();
}

bool HeaderStore::Open(const ChainId &chain, RelayState &state) {
  std::lock_guard<std::mutex> lock(chains_mutex_);
  if (chains_.count(chain)) {
    return true;
  }

  auto log = std::make_unique<ChainLog>();
  log->path = LogPath(chain);

  if (!util::ensure_directory(log->path.parent_path())) {
    return state.Fail(RelayState::Code::IO_ERROR, "datadir-unwritable",
                      "cannot create " + log->path.parent_path().string());
  }

  if (!ReadLog(*log, state)) {
    logger_->error("Header log {} is unusable: {}", log->path.string(),
                   state.ToString());
    return false;
  }

  logger_->info("Opened header log for {} (highest={}, tail={})",
                chain.ToString(), log->highest, log->tail.size());
  chains_.emplace(chain, std::move(log));
  return true;
}

bool HeaderStore::ReadLog(ChainLog &log, RelayState &state) const {
  log.highest = 0;
  log.complete_bytes = 0;
  log.line_offsets.clear();
  log.tail.clear();

  std::error_code ec;
  if (!std::filesystem::exists(log.path, ec)) {
    // Fresh chain
    return true;
  }

  std::ifstream file(log.path, std::ios::binary);
  if (!file) {
    return state.Fail(RelayState::Code::IO_ERROR, "log-unreadable",
                      log.path.string());
  }

  std::string line;
  std::vector<Header> records;
  uint64_t offset = 0;
  while (std::getline(file, line)) {
    // getline hits EOF before the delimiter only on the trailing partial line
    bool terminated = !file.eof();

    if (!DecodeLine(line, records)) {
      return state.Fail(RelayState::Code::IO_ERROR, "log-corrupt",
                        "undecodable record at byte " + std::to_string(offset));
    }
    for (size_t i = 0; i < records.size(); ++i) {
      if (records[i].number != log.highest + i + 1) {
        return state.Fail(RelayState::Code::IO_ERROR, "log-corrupt",
                          "expected block " + std::to_string(log.highest + i + 1) +
                              ", found " + std::to_string(records[i].number));
      }
    }

    if (terminated) {
      if (records.size() != BATCH_SIZE) {
        return state.Fail(RelayState::Code::IO_ERROR, "log-corrupt",
                          "complete line holds " +
                              std::to_string(records.size()) + " records");
      }
      log.line_offsets.push_back(offset);
      offset += line.size() + 1;
      log.complete_bytes = offset;
      log.highest += records.size();
    } else {
      if (records.size() >= BATCH_SIZE) {
        return state.Fail(RelayState::Code::IO_ERROR, "log-corrupt",
                          "unterminated line holds " +
                              std::to_string(records.size()) + " records");
      }
      log.highest += records.size();
      log.tail = std::move(records);
      records.clear();
    }
  }

  if (file.bad()) {
    return state.Fail(RelayState::Code::IO_ERROR, "log-unreadable",
                      log.path.string());
  }
  return true;
}

bool HeaderStore::Append(const ChainId &chain,
                         const std::vector<Header> &headers,
                         RelayState &state) {
  ChainLog *log = Find(chain);
  if (!log) {
    return state.Fail(RelayState::Code::IO_ERROR, "chain-not-open",
                      chain.ToString());
  }
  std::lock_guard<std::mutex> lock(log->mutex);

  // Validate everything before touching state
  std::vector<Header> fresh;
  for (const auto &h : headers) {
    if (h.number <= log->highest) {
      continue;
    }
    uint64_t expected = log->highest + fresh.size() + 1;
    if (h.number != expected) {
      return state.Fail(RelayState::Code::SYNC_ERROR, "non-contiguous-headers",
                        "expected block " + std::to_string(expected) +
                            ", got " + std::to_string(h.number));
    }
    fresh.push_back(h);
  }
  if (fresh.empty()) {
    return true;
  }

  std::vector<Header> pending = log->tail;
  pending.insert(pending.end(), fresh.begin(), fresh.end());

  size_t full_lines = pending.size() / BATCH_SIZE;
  std::string data;
  std::vector<uint64_t> new_offsets;
  for (size_t i = 0; i < full_lines; ++i) {
    new_offsets.push_back(log->complete_bytes + data.size());
    auto first = pending.begin() + i * BATCH_SIZE;
    EncodeLine(first, first + BATCH_SIZE, data);
    data += kLineTerminator;
  }
  uint64_t new_complete_bytes = log->complete_bytes + data.size();
  EncodeLine(pending.begin() + full_lines * BATCH_SIZE, pending.end(), data);

  if (!util::truncate_and_append(log->path, log->complete_bytes, data)) {
    logger_->error("Failed to write header log {}", log->path.string());
    return state.Fail(RelayState::Code::IO_ERROR, "log-write-failed",
                      log->path.string());
  }

  log->line_offsets.insert(log->line_offsets.end(), new_offsets.begin(),
                           new_offsets.end());
  log->complete_bytes = new_complete_bytes;
  log->tail.assign(pending.begin() + full_lines * BATCH_SIZE, pending.end());
  log->highest += fresh.size();

  logger_->debug("Stored blocks {}..{} for {} ({} complete batches, tail={})",
                 fresh.front().number, fresh.back().number, chain.ToString(),
                 log->line_offsets.size(), log->tail.size());
  return true;
}

bool HeaderStore::Load(const ChainId &chain, uint64_t start, uint64_t end,
                       std::vector<Header> &out, uint64_t &highest,
                       RelayState &state) const {
  out.clear();
  ChainLog *log = Find(chain);
  if (!log) {
    return state.Fail(RelayState::Code::IO_ERROR, "chain-not-open",
                      chain.ToString());
  }
  std::lock_guard<std::mutex> lock(log->mutex);
  highest = log->highest;

  if (start == 0) {
    start = 1;
  }
  if (end > log->highest) {
    return state.Fail(RelayState::Code::NOT_SYNCED, "not-synced",
                      "requested up to " + std::to_string(end) +
                          ", stored " + std::to_string(log->highest));
  }
  if (start > end) {
    return state.Fail(RelayState::Code::INVALID_RANGE, "invalid-range",
                      std::to_string(start) + " > " + std::to_string(end));
  }
  if (start == end) {
    return true;
  }

  out.reserve(end - start);
  uint64_t persisted = log->line_offsets.size() * BATCH_SIZE;

  if (start <= persisted) {
    std::ifstream file(log->path, std::ios::binary);
    if (!file) {
      return state.Fail(RelayState::Code::IO_ERROR, "log-unreadable",
                        log->path.string());
    }

    size_t line_index = (start - 1) / BATCH_SIZE;
    file.seekg(static_cast<std::streamoff>(log->line_offsets[line_index]));

    std::string line;
    std::vector<Header> records;
    uint64_t last_wanted = std::min<uint64_t>(end - 1, persisted);
    uint64_t next = start;
    while (next <= last_wanted) {
      if (!std::getline(file, line) || !DecodeLine(line, records) ||
          records.size() != BATCH_SIZE ||
          records.front().number != line_index * BATCH_SIZE + 1) {
        return state.Fail(RelayState::Code::IO_ERROR, "log-corrupt",
                          "cannot read batch " + std::to_string(line_index));
      }
      for (const auto &h : records) {
        if (h.number == next && next <= last_wanted) {
          out.push_back(h);
          ++next;
        }
      }
      ++line_index;
    }
  }

  for (const auto &h : log->tail) {
    if (h.number >= start && h.number < end) {
      out.push_back(h);
    }
  }

  if (out.size() != end - start) {
    return state.Fail(RelayState::Code::IO_ERROR, "log-corrupt",
                      "loaded " + std::to_string(out.size()) + " of " +
                          std::to_string(end - start) + " headers");
  }
  return true;
}

uint64_t HeaderStore::HighestStored(const ChainId &chain) const {
  ChainLog *log = Find(chain);
  if (!log) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(log->mutex);
  return log->highest;
}

std::vector<Header> HeaderStore::TailCache(const ChainId &chain) const {
  ChainLog *log = Find(chain);
  if (!log) {
    return {};
  }
  std::lock_guard<std::mutex> lock(log->mutex);
  return log->tail;
}

bool HeaderStore::ResetTailCache(const ChainId &chain, RelayState &state) {
  ChainLog *log = Find(chain);
  if (!log) {
    return state.Fail(RelayState::Code::IO_ERROR, "chain-not-open",
                      chain.ToString());
  }
  std::lock_guard<std::mutex> lock(log->mutex);
  logger_->warn("Reloading tail cache for {} from disk", chain.ToString());
  return ReadLog(*log, state);
}

} // namespace chain
} // namespace bridgerelay
