// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_server.hpp"
#include <algorithm>

namespace bridgerelay {
namespace network {

using tcp = boost::asio::ip::tcp;

// ---------------------------------------------------------------------------
// PeerSession
// ---------------------------------------------------------------------------

PeerSession::PeerSession(tcp::socket socket, PeerMessageRouter &router,
                         util::LoggerPtr logger)
    : socket_(std::move(socket)), strand_(socket_.get_executor()),
      router_(router), logger_(util::OrNullLogger(std::move(logger))),
      read_buffer_(MAX_FRAME_SIZE + 1) {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  remote_addr_ = ec ? std::string("unknown")
                    : ep.address().to_string() + ":" + std::to_string(ep.port());
}

void PeerSession::start() {
  boost::asio::post(strand_,
                    [self = shared_from_this()]() { self->start_read_impl(); });
}

void PeerSession::close() {
  boost::asio::post(strand_,
                    [self = shared_from_this()]() { self->close_impl(); });
}

void PeerSession::start_read_impl() {
  if (closed_) {
    return;
  }
  boost::asio::async_read_until(
      socket_, read_buffer_, '\n',
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](
                       const boost::system::error_code &ec, size_t length) {
            if (ec) {
              if (ec == boost::asio::error::not_found) {
                self->logger_->warn("{} sent a frame over {} bytes, closing",
                                    self->remote_addr_, MAX_FRAME_SIZE);
              } else if (ec != boost::asio::error::operation_aborted &&
                         ec != boost::asio::error::eof) {
                self->logger_->debug("read from {} failed: {}",
                                     self->remote_addr_, ec.message());
              }
              self->close_impl();
              return;
            }

            std::string frame(
                boost::asio::buffers_begin(self->read_buffer_.data()),
                boost::asio::buffers_begin(self->read_buffer_.data()) + length);
            self->read_buffer_.consume(length);

            // Strip '\n' (and a '\r' from line-oriented clients)
            frame.pop_back();
            if (!frame.empty() && frame.back() == '\r') {
              frame.pop_back();
            }
            if (!frame.empty()) {
              self->handle_frame(std::move(frame));
            }
            self->start_read_impl();
          }));
}

void PeerSession::handle_frame(std::string frame) {
  chain::RelayState state;
  std::optional<std::string> reply;
  if (!router_.Route(frame, state, reply)) {
    logger_->debug("bad frame from {}: {}", remote_addr_, state.ToString());
    return;
  }
  if (reply) {
    queue_write_impl(std::move(*reply));
  }
}

void PeerSession::queue_write_impl(std::string data) {
  if (closed_) {
    return;
  }
  send_queue_.push(std::move(data));
  if (!writing_) {
    do_write_impl();
  }
}

void PeerSession::do_write_impl() {
  if (send_queue_.empty() || closed_) {
    writing_ = false;
    return;
  }
  writing_ = true;
  boost::asio::async_write(
      socket_, boost::asio::buffer(send_queue_.front()),
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](
                       const boost::system::error_code &ec, size_t) {
            if (ec) {
              self->logger_->debug("write to {} failed: {}",
                                   self->remote_addr_, ec.message());
              self->close_impl();
              return;
            }
            self->send_queue_.pop();
            self->do_write_impl();
          }));
}

void PeerSession::close_impl() {
  if (closed_) {
    return;
  }
  closed_ = true;
  boost::system::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
  logger_->debug("session with {} closed", remote_addr_);
}

// ---------------------------------------------------------------------------
// PeerServer
// ---------------------------------------------------------------------------

PeerServer::PeerServer(boost::asio::io_context &io_context,
                       PeerMessageRouter &router, util::LoggerPtr logger)
    : io_context_(io_context), router_(router),
      logger_(util::OrNullLogger(std::move(logger))) {}

PeerServer::~PeerServer() { Stop(); }

bool PeerServer::Listen(uint16_t port) {
  if (acceptor_) {
    logger_->debug("already listening");
    return false;
  }

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const std::exception &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    listen_port_ = acceptor_->local_endpoint().port();
    logger_->info("Listening for peers on port {}", listen_port_);
    start_accept();
    return true;
  } catch (const std::exception &e) {
    logger_->error("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void PeerServer::start_accept() {
  if (!acceptor_) {
    return;
  }
  acceptor_->async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        handle_accept(ec, std::move(socket));
      });
}

void PeerServer::handle_accept(const boost::system::error_code &ec,
                               tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      logger_->debug("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(tcp::no_delay(true), opt_ec);

  auto session =
      std::make_shared<PeerSession>(std::move(socket), router_, logger_);
  logger_->debug("connection from {} accepted", session->remote_address());
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<PeerSession> &w) {
                                     return w.expired();
                                   }),
                    sessions_.end());
    sessions_.push_back(session);
  }
  session->start();
  start_accept();
}

void PeerServer::Stop() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listen_port_ = 0;

  std::vector<std::weak_ptr<PeerSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto &w : sessions) {
    if (auto s = w.lock()) {
      s->close();
    }
  }
}

uint16_t PeerServer::listening_port() const { return listen_port_; }

size_t PeerServer::SessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return std::count_if(
      sessions_.begin(), sessions_.end(),
      [](const std::weak_ptr<PeerSession> &w) { return !w.expired(); });
}

} // namespace network
} // namespace bridgerelay
