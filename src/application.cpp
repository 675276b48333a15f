// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace bridgerelay {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config)
    : config_(config), logger_(util::LogManager::GetLogger("app")) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility)
  std::cout << GetStartupBanner(config_.index) << std::flush;

  logger_->info("Initializing bridge-relay...");

  auto errors = ValidateConfig(config_);
  if (!errors.empty()) {
    for (const auto &e : errors) {
      logger_->error("Invalid configuration: {}", e);
    }
    return false;
  }
  auto resolved = ResolveConfig(config_);
  if (!resolved) {
    logger_->error("Invalid configuration: cannot resolve index/address");
    return false;
  }
  resolved_ = *resolved;

  if (!init_datadir()) {
    logger_->error("Failed to initialize data directory");
    return false;
  }

  if (!init_chains()) {
    logger_->error("Failed to initialize header logs");
    return false;
  }

  if (!init_bridge()) {
    logger_->error("Failed to initialize bridge components");
    return false;
  }

  if (!init_network()) {
    logger_->error("Failed to initialize peer network");
    return false;
  }

  // Chain i is synced with clients[i] and proposes against chain 1 - i
  for (size_t i = 0; i < 2; ++i) {
    relay_manager_->AddChain(resolved_.chains[i], resolved_.chains[1 - i],
                             *clients_[i]);
  }

  logger_->info("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    logger_->warn("Application already running");
    return false;
  }

  logger_->info("Starting bridge-relay...");

  setup_signal_handlers();

  // Bind before any thread runs so a busy port fails cleanly
  if (!peer_server_->Listen(config_.port)) {
    logger_->error("Failed to listen on port {}", config_.port);
    return false;
  }

  work_guard_.emplace(io_context_.get_executor());
  for (size_t i = 0; i < IO_THREADS; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  relay_manager_->Start();

  running_ = true;

  logger_->info("bridge-relay started successfully");
  logger_->info("Data directory: {}", config_.datadir.string());
  logger_->info("Listening on port: {}", peer_server_->listening_port());
  logger_->info("Local address: {}", resolved_.local_address.ToString());
  logger_->info("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    if (datadir_locked_) {
      util::UnlockDirectory(config_.datadir, ".lock");
      datadir_locked_ = false;
    }
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  logger_->info("Shutting down bridge-relay...");

  running_ = false;

  // Stop the chain threads first; a running tick ends at its next chunk
  if (relay_manager_) {
    logger_->info("Stopping relay loop...");
    relay_manager_->Stop();
  }

  // Stop accepting peers and close open sessions
  if (peer_server_) {
    logger_->info("Stopping peer server...");
    peer_server_->Stop();
  }

  // Let pending handlers drain, then stop the executor
  work_guard_.reset();
  io_context_.stop();
  for (auto &t : io_threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  io_threads_.clear();

  // Release data directory lock
  if (datadir_locked_) {
    logger_->info("Releasing data directory lock...");
    util::UnlockDirectory(config_.datadir, ".lock");
    datadir_locked_ = false;
  }

  logger_->info("Shutdown complete");
}

bool Application::init_datadir() {
  logger_->info("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    logger_->error("Failed to create data directory: {}",
                   config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent multiple instances
  std::string reason;
  util::LockResult lock_result =
      util::LockDirectory(config_.datadir, reason, ".lock");

  if (lock_result == util::LockResult::ErrorWrite) {
    logger_->error("Cannot write to data directory {}: {}",
                   config_.datadir.string(), reason);
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    logger_->error("Cannot obtain a lock on data directory {}. "
                   "bridge-relay is probably already running. ({})",
                   config_.datadir.string(), reason);
    return false;
  }

  datadir_locked_ = true;
  logger_->debug("Successfully locked data directory");
  return true;
}

bool Application::init_chains() {
  logger_->info("Opening header logs...");

  header_store_ = std::make_unique<chain::HeaderStore>(
      config_.datadir, util::LogManager::GetLogger("sync"));

  for (const auto &chain : resolved_.chains) {
    chain::RelayState state;
    if (!header_store_->Open(chain, state)) {
      logger_->error("Cannot open header log of {}: {}", chain.ToString(),
                     state.ToString());
      return false;
    }
    logger_->info("Chain {}: {} headers stored", chain.ToString(),
                  header_store_->HighestStored(chain));
  }

  for (const auto &url : config_.clients) {
    auto endpoint = chain::HttpEndpoint::Parse(url);
    if (!endpoint) {
      logger_->error("Invalid client URL: {}", url);
      return false;
    }
    clients_.push_back(std::make_unique<chain::RpcChainClient>(
        *endpoint, config_.rpc_timeout, util::LogManager::GetLogger("sync")));
  }

  return true;
}

bool Application::init_bridge() {
  logger_->info("Initializing bridge links (threshold {})...",
                config_.propose_threshold);

  auto bridge_logger = util::LogManager::GetLogger("bridge");
  bridge_links_ = std::make_unique<bridge::BridgeLinkRegistry>(bridge_logger);
  proposal_gate_ = std::make_unique<bridge::ProposalGate>(
      *bridge_links_, *header_store_, config_.propose_threshold,
      bridge_logger);
  return true;
}

bool Application::init_network() {
  logger_->info("Initializing peer network ({} peers)...",
                config_.peers.size());

  auto net_logger = util::LogManager::GetLogger("network");
  peer_directory_ = std::make_unique<network::PeerDirectory>(config_.peers);
  signature_store_ = std::make_unique<network::SignatureStore>();
  router_ = std::make_unique<network::PeerMessageRouter>(
      *bridge_links_, *signature_store_, *peer_directory_, net_logger);
  peer_server_ =
      std::make_unique<network::PeerServer>(io_context_, *router_, net_logger);
  broadcaster_ = std::make_unique<network::TcpBroadcaster>(
      io_context_, *peer_directory_,
      network::TcpBroadcaster::DEFAULT_TIMEOUT, net_logger);

  bridge::RelayManager::Config relay_config;
  relay_config.local_address = resolved_.local_address;
  relay_config.query_delay = config_.query_delay;
  relay_manager_ = std::make_unique<bridge::RelayManager>(
      *header_store_, *bridge_links_, *proposal_gate_,
      *broadcaster_, relay_config, util::LogManager::GetLogger("sync"),
      util::LogManager::GetLogger("bridge"));
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace bridgerelay
