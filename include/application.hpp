// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app_config.hpp"
#include "bridge/bridge_link.hpp"
#include "bridge/proposal_gate.hpp"
#include "bridge/relay_manager.hpp"
#include "chain/header_store.hpp"
#include "chain/rpc_chain_client.hpp"
#include "network/broadcaster.hpp"
#include "network/peer_directory.hpp"
#include "network/peer_message_router.hpp"
#include "network/peer_server.hpp"
#include "network/signature_store.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <csignal>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace bridgerelay {
namespace app {

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  // Threads running the peer io_context (chain ticks have their own)
  static constexpr size_t IO_THREADS = 2;

  explicit Application(const AppConfig &config);
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  chain::HeaderStore &header_store() { return *header_store_; }
  bridge::BridgeLinkRegistry &bridge_links() { return *bridge_links_; }
  network::SignatureStore &signature_store() { return *signature_store_; }
  network::PeerServer &peer_server() { return *peer_server_; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  ResolvedConfig resolved_{};
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  bool datadir_locked_{false};

  util::LoggerPtr logger_;

  // Shared executor
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<chain::HeaderStore> header_store_;
  std::vector<std::unique_ptr<chain::RpcChainClient>> clients_;
  std::unique_ptr<bridge::BridgeLinkRegistry> bridge_links_;
  std::unique_ptr<bridge::ProposalGate> proposal_gate_;
  std::unique_ptr<network::PeerDirectory> peer_directory_;
  std::unique_ptr<network::SignatureStore> signature_store_;
  std::unique_ptr<network::PeerMessageRouter> router_;
  std::unique_ptr<network::PeerServer> peer_server_;
  std::unique_ptr<network::TcpBroadcaster> broadcaster_;
  std::unique_ptr<bridge::RelayManager> relay_manager_;

  // Initialization steps
  bool init_datadir();
  bool init_chains();
  bool init_bridge();
  bool init_network();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace bridgerelay
