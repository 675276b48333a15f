// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/peer_directory.hpp"
#include "util/logging.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace bridgerelay {
namespace network {

// Broadcaster - sends one frame to every known peer
// Implementations:
// - TcpBroadcaster: one short-lived TCP connection per peer
// - test doubles recording the frames
class Broadcaster {
public:
  virtual ~Broadcaster() = default;

  // Fire-and-forget; per-peer failures are logged by the implementation
  virtual void Broadcast(const std::string &frame) = 0;
};

/**
 * TcpBroadcaster - resolve, connect, write one frame, close
 *
 * Each send runs on its own strand of `io_context` and is bounded by
 * `timeout` (connect plus write). Returns immediately.
 */
class TcpBroadcaster : public Broadcaster {
public:
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{
      std::chrono::seconds(5)};

  TcpBroadcaster(boost::asio::io_context &io_context,
                 const PeerDirectory &peers, std::chrono::milliseconds timeout,
                 util::LoggerPtr logger);

  void Broadcast(const std::string &frame) override;

  // Send to a single "host:port" peer
  void SendTo(const std::string &peer, const std::string &frame);

private:
  boost::asio::io_context &io_context_;
  const PeerDirectory &peers_;
  std::chrono::milliseconds timeout_;
  util::LoggerPtr logger_;
};

} // namespace network
} // namespace bridgerelay
