// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace bridgerelay {
namespace chain {

/**
 * Relay state - records why an operation failed
 *
 * Same shape as a block validation state: the failing function calls
 * Fail() (which returns false) and the caller inspects the code and
 * reason. Every per-cycle failure is recoverable; the caller logs it and
 * retries on the next tick.
 */
class RelayState {
public:
  enum class Code {
    OK,
    SYNC_ERROR,        // Chain query or log write failed during sync
    NOT_SYNCED,        // Requested range not yet stored
    EMPTY_RANGE,       // Merkle commitment over zero headers
    QUERY_ERROR,       // Bridge contract read failed
    MALFORMED_MESSAGE, // Peer frame could not be decoded
    PROTOCOL_ERROR,    // Peer frame decoded but cannot be handled
    IO_ERROR,          // Header log unreadable or unwritable
    INVALID_RANGE,     // start > end
  };

  RelayState() : code_(Code::OK) {}

  bool IsValid() const { return code_ == Code::OK; }
  Code GetCode() const { return code_; }

  bool Fail(Code code, const std::string &reject_reason,
            const std::string &debug_message = "") {
    code_ = code;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  void Reset() {
    code_ = Code::OK;
    reject_reason_.clear();
    debug_message_.clear();
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  // "reason (debug)" or just "reason"
  std::string ToString() const {
    if (debug_message_.empty()) {
      return reject_reason_;
    }
    return reject_reason_ + " (" + debug_message_ + ")";
  }

private:
  Code code_;
  std::string reject_reason_;
  std::string debug_message_;
};

} // namespace chain
} // namespace bridgerelay
