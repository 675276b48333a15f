// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header.hpp"
#include "util/files.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bridgerelay {
namespace app {

// Application configuration
// Sources, later wins: defaults, JSON file (--conf=), command line
struct AppConfig {
  // Data directory (header logs, lock file, debug.log)
  std::filesystem::path datadir;

  // Peer protocol
  uint16_t port = 8000;
  std::vector<std::string> peers; // "host:port"

  // JSON-RPC endpoints, index-aligned with the two chains of `index`
  std::vector<std::string> clients;

  // "<addrA>_<addrB>": bridge contract addresses of the two chains
  std::string index;

  // This node's wallet address
  std::string address;

  uint64_t propose_threshold = 512;
  std::chrono::milliseconds query_delay{10000};
  std::chrono::milliseconds rpc_timeout{5000};

  // Logging
  std::string log_level = "info";
  std::vector<std::string> debug_components;
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Values derived from a validated AppConfig
struct ResolvedConfig {
  chain::ChainId chains[2];
  chain::Address local_address;
};

// Result of command-line parsing
struct CommandLine {
  bool show_help = false;
  bool show_version = false;
  std::optional<std::filesystem::path> conf_file;
};

/**
 * Apply a JSON config file. Keys: port, peers, clients, index, datadir,
 * proposeThreshold, queryDelay, address, rpcTimeout, loglevel.
 * Unknown keys are errors. Returns false when anything was appended to
 * `errors`.
 */
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::vector<std::string> &errors);

/**
 * Parse argv (without argv[0]). A --conf=<file> is applied first, then the
 * remaining flags in order. Returns false when anything was appended to
 * `errors`.
 */
bool ParseCommandLine(const std::vector<std::string> &args, AppConfig &config,
                      CommandLine &cmdline, std::vector<std::string> &errors);

// Check a fully merged config; empty result means valid
std::vector<std::string> ValidateConfig(const AppConfig &config);

// Parse index/address of a config that passed ValidateConfig()
std::optional<ResolvedConfig> ResolveConfig(const AppConfig &config);

// Text for --help
std::string GetUsage(const std::string &program_name);

} // namespace app
} // namespace bridgerelay
