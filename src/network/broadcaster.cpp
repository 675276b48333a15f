// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/broadcaster.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/strand.hpp>
#include <memory>

namespace bridgerelay {
namespace network {

namespace {

using tcp = boost::asio::ip::tcp;

// One outbound frame: resolve -> connect -> write -> close
class OutboundSend : public std::enable_shared_from_this<OutboundSend> {
public:
  OutboundSend(boost::asio::io_context &io_context, std::string host,
               uint16_t port, std::string frame,
               std::chrono::milliseconds timeout, util::LoggerPtr logger)
      : strand_(boost::asio::make_strand(io_context)), resolver_(strand_),
        socket_(strand_), timer_(strand_), host_(std::move(host)),
        port_(port), frame_(std::move(frame)), timeout_(timeout),
        logger_(std::move(logger)) {}

  void start() {
    boost::asio::post(strand_, [self = shared_from_this()]() { self->do_start(); });
  }

private:
  void do_start() {
    timer_.expires_after(timeout_);
    timer_.async_wait([this, self = shared_from_this()](
                          const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted || done_) {
        return;
      }
      logger_->warn("send to {}:{} timed out after {} ms", host_, port_,
                    timeout_.count());
      finish();
    });

    resolver_.async_resolve(
        host_, std::to_string(port_),
        [this, self = shared_from_this()](const boost::system::error_code &ec,
                                          tcp::resolver::results_type results) {
          if (done_) return;
          if (ec) {
            logger_->debug("failed to resolve {}: {}", host_, ec.message());
            return finish();
          }
          boost::asio::async_connect(
              socket_, results,
              [this, self](const boost::system::error_code &ec,
                           const tcp::endpoint &) {
                if (done_) return;
                if (ec) {
                  logger_->debug("failed to connect to {}:{}: {}", host_,
                                 port_, ec.message());
                  return finish();
                }
                boost::asio::async_write(
                    socket_, boost::asio::buffer(frame_),
                    [this, self](const boost::system::error_code &ec, size_t) {
                      if (done_) return;
                      if (ec) {
                        logger_->debug("failed to send to {}:{}: {}", host_,
                                       port_, ec.message());
                      } else {
                        logger_->trace("sent {} bytes to {}:{}", frame_.size(),
                                       host_, port_);
                      }
                      finish();
                    });
              });
        });
  }

  void finish() {
    done_ = true;
    boost::system::error_code ignored;
    resolver_.cancel();
    timer_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  boost::asio::steady_timer timer_;
  std::string host_;
  uint16_t port_;
  std::string frame_;
  std::chrono::milliseconds timeout_;
  util::LoggerPtr logger_;
  // Only touched on strand_
  bool done_{false};
};

} // namespace

TcpBroadcaster::TcpBroadcaster(boost::asio::io_context &io_context,
                               const PeerDirectory &peers,
                               std::chrono::milliseconds timeout,
                               util::LoggerPtr logger)
    : io_context_(io_context), peers_(peers), timeout_(timeout),
      logger_(util::OrNullLogger(std::move(logger))) {}

void TcpBroadcaster::Broadcast(const std::string &frame) {
  auto peers = peers_.GetPeers();
  logger_->debug("broadcasting {} bytes to {} peers", frame.size(),
                 peers.size());
  for (const auto &peer : peers) {
    SendTo(peer, frame);
  }
}

void TcpBroadcaster::SendTo(const std::string &peer, const std::string &frame) {
  auto endpoint = util::SplitHostPort(peer);
  if (!endpoint) {
    logger_->warn("skipping invalid peer address '{}'", peer);
    return;
  }
  std::make_shared<OutboundSend>(io_context_, endpoint->first, endpoint->second,
                                 frame, timeout_, logger_)
      ->start();
}

} // namespace network
} // namespace bridgerelay
