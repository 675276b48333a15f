// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/peer_message_router.hpp"
#include "util/logging.hpp"
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace bridgerelay {
namespace network {

/**
 * PeerSession - one inbound peer connection
 *
 * Reads '\n'-terminated frames and hands each to the router. Replies are
 * queued and written in order. A malformed frame is dropped and the session
 * keeps reading; an oversized frame, EOF or socket error ends the session.
 * All state is touched on strand_ only.
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
  PeerSession(boost::asio::ip::tcp::socket socket, PeerMessageRouter &router,
              util::LoggerPtr logger);

  PeerSession(const PeerSession &) = delete;
  PeerSession &operator=(const PeerSession &) = delete;

  void start();
  void close();

  const std::string &remote_address() const { return remote_addr_; }

private:
  void start_read_impl();
  void handle_frame(std::string frame);
  void queue_write_impl(std::string data);
  void do_write_impl();
  void close_impl();

  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  PeerMessageRouter &router_;
  util::LoggerPtr logger_;
  std::string remote_addr_;

  boost::asio::streambuf read_buffer_;
  std::queue<std::string> send_queue_;
  bool writing_{false};
  bool closed_{false};
};

/**
 * PeerServer - TCP listener for the peer protocol
 *
 * Runs on the caller's io_context; the io_context threads drive every
 * session concurrently. Listen() on port 0 picks a free port (see
 * listening_port()).
 */
class PeerServer {
public:
  PeerServer(boost::asio::io_context &io_context, PeerMessageRouter &router,
             util::LoggerPtr logger);
  ~PeerServer();

  PeerServer(const PeerServer &) = delete;
  PeerServer &operator=(const PeerServer &) = delete;

  // Bind and start accepting. False if the port cannot be bound.
  bool Listen(uint16_t port);

  // Stop accepting and close all sessions
  void Stop();

  // Bound port (0 if not listening)
  uint16_t listening_port() const;

  size_t SessionCount() const;

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  PeerMessageRouter &router_;
  util::LoggerPtr logger_;

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  uint16_t listen_port_{0};

  mutable std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<PeerSession>> sessions_;
};

} // namespace network
} // namespace bridgerelay
