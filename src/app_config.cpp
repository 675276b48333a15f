// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app_config.hpp"
#include "chain/rpc_chain_client.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace bridgerelay {
namespace app {

using json = nlohmann::json;

namespace {

bool starts_with(const std::string &arg, const char *prefix,
                 std::string &value) {
  const std::string p(prefix);
  if (arg.compare(0, p.size(), p) != 0) {
    return false;
  }
  value = arg.substr(p.size());
  return true;
}

std::vector<std::string> split_commas(const std::string &list) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < list.length()) {
    size_t comma = list.find(',', pos);
    if (comma == std::string::npos) {
      out.push_back(list.substr(pos));
      break;
    }
    out.push_back(list.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

// Read a JSON value that must be a non-negative integer
std::optional<uint64_t> json_unsigned(const json &value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(value.get<int64_t>());
  }
  return std::nullopt;
}

bool json_string_list(const json &value, std::vector<std::string> &out) {
  if (!value.is_array()) {
    return false;
  }
  std::vector<std::string> list;
  for (const auto &item : value) {
    if (!item.is_string()) {
      return false;
    }
    list.push_back(item.get<std::string>());
  }
  out = std::move(list);
  return true;
}

} // namespace

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::vector<std::string> &errors) {
  const size_t errors_before = errors.size();

  std::string content = util::read_file_string(path);
  if (content.empty()) {
    errors.push_back("Cannot read config file " + path.string());
    return false;
  }

  json root = json::parse(content, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    errors.push_back("Config file " + path.string() +
                     " is not a JSON object");
    return false;
  }

  for (const auto &[key, value] : root.items()) {
    if (key == "port") {
      auto port = json_unsigned(value);
      if (!port || *port == 0 || *port > 65535) {
        errors.push_back("config: 'port' must be a number between 1 and 65535");
      } else {
        config.port = static_cast<uint16_t>(*port);
      }
    } else if (key == "peers") {
      if (!json_string_list(value, config.peers)) {
        errors.push_back("config: 'peers' must be an array of strings");
      }
    } else if (key == "clients") {
      if (!json_string_list(value, config.clients)) {
        errors.push_back("config: 'clients' must be an array of strings");
      }
    } else if (key == "index") {
      if (!value.is_string()) {
        errors.push_back("config: 'index' must be a string");
      } else {
        config.index = value.get<std::string>();
      }
    } else if (key == "address") {
      if (!value.is_string()) {
        errors.push_back("config: 'address' must be a string");
      } else {
        config.address = value.get<std::string>();
      }
    } else if (key == "datadir") {
      if (!value.is_string() || value.get<std::string>().empty()) {
        errors.push_back("config: 'datadir' must be a non-empty string");
      } else {
        config.datadir = value.get<std::string>();
      }
    } else if (key == "proposeThreshold") {
      auto threshold = json_unsigned(value);
      if (!threshold) {
        errors.push_back("config: 'proposeThreshold' must be a non-negative integer");
      } else {
        config.propose_threshold = *threshold;
      }
    } else if (key == "queryDelay") {
      auto delay = json_unsigned(value);
      if (!delay) {
        errors.push_back("config: 'queryDelay' must be a non-negative integer (ms)");
      } else {
        config.query_delay = std::chrono::milliseconds(*delay);
      }
    } else if (key == "rpcTimeout") {
      auto timeout = json_unsigned(value);
      if (!timeout) {
        errors.push_back("config: 'rpcTimeout' must be a non-negative integer (ms)");
      } else {
        config.rpc_timeout = std::chrono::milliseconds(*timeout);
      }
    } else if (key == "loglevel") {
      if (!value.is_string()) {
        errors.push_back("config: 'loglevel' must be a string");
      } else {
        config.log_level = value.get<std::string>();
      }
    } else {
      errors.push_back("config: unknown key '" + key + "'");
    }
  }

  return errors.size() == errors_before;
}

bool ParseCommandLine(const std::vector<std::string> &args, AppConfig &config,
                      CommandLine &cmdline, std::vector<std::string> &errors) {
  const size_t errors_before = errors.size();
  std::string value;

  // Config file first so that flags override it
  for (const auto &arg : args) {
    if (starts_with(arg, "--conf=", value)) {
      if (value.empty()) {
        errors.push_back("--conf requires a file name");
      } else {
        cmdline.conf_file = value;
      }
    }
  }
  if (cmdline.conf_file) {
    LoadConfigFile(*cmdline.conf_file, config, errors);
  }

  // Repeatable list flags replace a list coming from the config file
  bool peers_from_cli = false;
  bool clients_from_cli = false;

  for (const auto &arg : args) {
    if (arg == "--help") {
      cmdline.show_help = true;
    } else if (arg == "--version") {
      cmdline.show_version = true;
    } else if (starts_with(arg, "--conf=", value)) {
      // handled above
    } else if (starts_with(arg, "--datadir=", value)) {
      if (value.empty()) {
        errors.push_back("--datadir requires a path");
      } else {
        config.datadir = value;
      }
    } else if (starts_with(arg, "--port=", value)) {
      auto port_opt = util::SafeParsePort(value);
      if (!port_opt) {
        errors.push_back("Invalid port number: " + value +
                         " (must be between 1 and 65535)");
      } else {
        config.port = *port_opt;
      }
    } else if (starts_with(arg, "--peer=", value)) {
      if (!peers_from_cli) {
        config.peers.clear();
        peers_from_cli = true;
      }
      config.peers.push_back(value);
    } else if (starts_with(arg, "--client=", value)) {
      if (!clients_from_cli) {
        config.clients.clear();
        clients_from_cli = true;
      }
      config.clients.push_back(value);
    } else if (starts_with(arg, "--index=", value)) {
      config.index = value;
    } else if (starts_with(arg, "--address=", value)) {
      config.address = value;
    } else if (starts_with(arg, "--proposethreshold=", value)) {
      auto threshold = util::SafeParseUint64(value);
      if (!threshold) {
        errors.push_back("Invalid propose threshold: " + value);
      } else {
        config.propose_threshold = *threshold;
      }
    } else if (starts_with(arg, "--querydelay=", value)) {
      auto delay = util::SafeParseUint64(value);
      if (!delay) {
        errors.push_back("Invalid query delay: " + value);
      } else {
        config.query_delay = std::chrono::milliseconds(*delay);
      }
    } else if (starts_with(arg, "--rpctimeout=", value)) {
      auto timeout = util::SafeParseUint64(value);
      if (!timeout) {
        errors.push_back("Invalid RPC timeout: " + value);
      } else {
        config.rpc_timeout = std::chrono::milliseconds(*timeout);
      }
    } else if (arg == "--verbose") {
      config.verbose = true;
      config.log_level = "debug";
    } else if (starts_with(arg, "--loglevel=", value)) {
      config.log_level = value;
    } else if (starts_with(arg, "--debug=", value)) {
      for (auto &component : split_commas(value)) {
        config.debug_components.push_back(std::move(component));
      }
    } else {
      errors.push_back("Unknown option: " + arg);
    }
  }

  return errors.size() == errors_before;
}

std::vector<std::string> ValidateConfig(const AppConfig &config) {
  std::vector<std::string> errors;

  if (config.datadir.empty()) {
    errors.push_back("datadir must not be empty");
  }

  if (!util::ParseBridgeIndex(config.index)) {
    errors.push_back("index must be '<addrA>_<addrB>' with two distinct "
                     "20-byte hex addresses (got '" + config.index + "')");
  }

  if (config.clients.size() != 2) {
    errors.push_back("exactly 2 clients are required (got " +
                     std::to_string(config.clients.size()) + ")");
  }
  for (const auto &client : config.clients) {
    if (!chain::HttpEndpoint::Parse(client)) {
      errors.push_back("invalid client URL '" + client +
                       "' (expected http://host[:port][/path])");
    }
  }

  if (!util::SafeParseAddress(config.address)) {
    errors.push_back("address must be a 20-byte hex address (got '" +
                     config.address + "')");
  }

  for (const auto &peer : config.peers) {
    if (!util::SplitHostPort(peer)) {
      errors.push_back("invalid peer '" + peer + "' (expected host:port)");
    }
  }

  if (config.propose_threshold < 2) {
    errors.push_back("proposeThreshold must be at least 2");
  }
  if (config.query_delay.count() <= 0) {
    errors.push_back("queryDelay must be greater than 0");
  }
  if (config.rpc_timeout.count() <= 0) {
    errors.push_back("rpcTimeout must be greater than 0");
  }

  return errors;
}

std::optional<ResolvedConfig> ResolveConfig(const AppConfig &config) {
  auto index = util::ParseBridgeIndex(config.index);
  auto address = util::SafeParseAddress(config.address);
  if (!index || !address) {
    return std::nullopt;
  }
  ResolvedConfig resolved;
  resolved.chains[0] = index->first;
  resolved.chains[1] = index->second;
  resolved.local_address = *address;
  return resolved;
}

std::string GetUsage(const std::string &program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --conf=<file>             JSON config file (applied before other flags)\n"
      << "  --datadir=<path>          Data directory (default: ~/.bridge-relay)\n"
      << "  --port=<port>             Peer listen port (default: 8000)\n"
      << "  --peer=<host:port>        Peer to broadcast to (repeatable)\n"
      << "  --client=<url>            JSON-RPC endpoint, one per chain (repeat twice)\n"
      << "  --index=<addrA>_<addrB>   Bridge contract addresses of the two chains\n"
      << "  --address=<addr>          This node's wallet address\n"
      << "  --proposethreshold=<n>    Pending headers needed to propose (default: 512)\n"
      << "  --querydelay=<ms>         Delay between relay ticks (default: 10000)\n"
      << "  --rpctimeout=<ms>         Timeout of one JSON-RPC call (default: 5000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: sync, bridge, network, app, all\n"
      << "                       Can be comma-separated: --debug=sync,bridge\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n";
  return out.str();
}

} // namespace app
} // namespace bridgerelay
