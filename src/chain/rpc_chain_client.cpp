// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/rpc_chain_client.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <map>

namespace bridgerelay {
namespace chain {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace {

// Largest reply we accept (a batch of 100 blocks is well under this)
constexpr uint64_t kMaxResponseBody = 16 * 1024 * 1024;

std::string JsonString(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    throw ChainClientError(std::string("missing field '") + key + "'");
  }
  return it->get<std::string>();
}

uint64_t JsonQuantity(const json &obj, const char *key) {
  auto value = util::ParseHexQuantity(JsonString(obj, key));
  if (!value) {
    throw ChainClientError(std::string("bad quantity in '") + key + "'");
  }
  return *value;
}

uint256 JsonHash(const json &obj, const char *key) {
  auto value = util::SafeParseHash(JsonString(obj, key));
  if (!value) {
    throw ChainClientError(std::string("bad hash in '") + key + "'");
  }
  return *value;
}

} // namespace

std::optional<HttpEndpoint> HttpEndpoint::Parse(const std::string &url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    return std::nullopt;
  }
  std::string rest = url.substr(scheme.size());

  HttpEndpoint ep;
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    ep.target = rest.substr(slash);
  }

  // "[v6]" or "[v6]:port"
  std::string port_part;
  bool has_port = false;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::nullopt;
      }
      port_part = after.substr(1);
      has_port = true;
    }
    authority = authority.substr(1, close - 1);
  } else {
    auto colon = authority.find(':');
    if (colon != std::string::npos) {
      port_part = authority.substr(colon + 1);
      has_port = true;
      authority = authority.substr(0, colon);
    }
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  if (has_port) {
    auto port = util::SafeParsePort(port_part);
    if (!port) {
      return std::nullopt;
    }
    ep.port = std::to_string(*port);
  }
  ep.host = authority;
  return ep;
}

RpcChainClient::RpcChainClient(HttpEndpoint endpoint,
                               std::chrono::milliseconds timeout,
                               util::LoggerPtr logger)
    : endpoint_(std::move(endpoint)), timeout_(timeout),
      logger_(util::OrNullLogger(std::move(logger))) {}

json RpcChainClient::Post(const json &body) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);

  http::request<http::string_body> req{http::verb::post, endpoint_.target, 11};
  req.set(http::field::host, endpoint_.host);
  req.set(http::field::content_type, "application/json");
  req.set(http::field::user_agent, "bridge-relay");
  req.body() = body.dump();
  req.prepare_payload();

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxResponseBody);

  beast::error_code failure;
  const char *stage = "resolve";
  bool done = false;

  auto fail = [&](const char *where, beast::error_code ec) {
    stage = where;
    failure = ec;
    done = true;
  };

  resolver.async_resolve(
      endpoint_.host, endpoint_.port,
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          return fail("resolve", ec);
        }
        stream.async_connect(results, [&](beast::error_code ec,
                                          const tcp::endpoint &) {
          if (ec) {
            return fail("connect", ec);
          }
          http::async_write(stream, req, [&](beast::error_code ec, size_t) {
            if (ec) {
              return fail("write", ec);
            }
            http::async_read(stream, buffer, parser,
                             [&](beast::error_code ec, size_t) {
                               if (ec) {
                                 return fail("read", ec);
                               }
                               done = true;
                             });
          });
        });
      });

  ioc.run_for(timeout_);

  if (!done) {
    throw ChainClientError("timeout after " + std::to_string(timeout_.count()) +
                           "ms talking to " + endpoint_.host);
  }
  if (failure) {
    throw ChainClientError(std::string(stage) + " failed: " + failure.message());
  }

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  const auto &res = parser.get();
  if (res.result() != http::status::ok) {
    throw ChainClientError("HTTP " + std::to_string(res.result_int()));
  }

  json reply = json::parse(res.body(), nullptr, false);
  if (reply.is_discarded()) {
    throw ChainClientError("invalid JSON in reply");
  }
  return reply;
}

json RpcChainClient::Call(const std::string &method, json params) {
  json request = {{"jsonrpc", "2.0"},
                  {"id", next_id_++},
                  {"method", method},
                  {"params", std::move(params)}};

  logger_->trace("RPC {} -> {}", method, endpoint_.host);
  json reply = Post(request);

  if (!reply.is_object()) {
    throw ChainClientError(method + ": reply is not an object");
  }
  if (auto err = reply.find("error"); err != reply.end() && !err->is_null()) {
    throw ChainClientError(method + ": " + err->dump());
  }
  auto result = reply.find("result");
  if (result == reply.end()) {
    throw ChainClientError(method + ": reply has no result");
  }
  return *result;
}

uint64_t RpcChainClient::GetBlockNumber() {
  json result = Call("eth_blockNumber", json::array());
  if (!result.is_string()) {
    throw ChainClientError("eth_blockNumber: result is not a string");
  }
  auto number = util::ParseHexQuantity(result.get<std::string>());
  if (!number) {
    throw ChainClientError("eth_blockNumber: bad quantity");
  }
  return *number;
}

Header RpcChainClient::ParseBlock(const json &block) {
  if (!block.is_object()) {
    throw ChainClientError("block is null or not an object");
  }
  Header h;
  h.number = JsonQuantity(block, "number");
  h.timestamp = JsonQuantity(block, "timestamp");
  h.prevHeaderHash = JsonHash(block, "parentHash");
  h.txRoot = JsonHash(block, "transactionsRoot");
  h.receiptsRoot = JsonHash(block, "receiptsRoot");
  return h;
}

std::vector<Header> RpcChainClient::GetHeaders(uint64_t first, uint64_t last) {
  if (first > last) {
    return {};
  }

  // One batched request, ids map back to block numbers
  json batch = json::array();
  std::map<uint64_t, uint64_t> id_to_number;
  for (uint64_t n = first; n <= last; ++n) {
    uint64_t id = next_id_++;
    id_to_number[id] = n;
    batch.push_back({{"jsonrpc", "2.0"},
                     {"id", id},
                     {"method", "eth_getBlockByNumber"},
                     {"params", {util::FormatHexQuantity(n), false}}});
  }

  json reply = Post(batch);
  if (!reply.is_array() || reply.size() != id_to_number.size()) {
    throw ChainClientError("eth_getBlockByNumber: batch reply size mismatch");
  }

  std::map<uint64_t, Header> by_number;
  for (const auto &item : reply) {
    if (!item.is_object() || !item.contains("id") ||
        !item["id"].is_number_unsigned()) {
      throw ChainClientError("eth_getBlockByNumber: reply without id");
    }
    auto it = id_to_number.find(item["id"].get<uint64_t>());
    if (it == id_to_number.end()) {
      throw ChainClientError("eth_getBlockByNumber: unknown id in reply");
    }
    if (auto err = item.find("error"); err != item.end() && !err->is_null()) {
      throw ChainClientError("eth_getBlockByNumber: " + err->dump());
    }
    auto result = item.find("result");
    if (result == item.end()) {
      throw ChainClientError("eth_getBlockByNumber: reply has no result");
    }
    Header h = ParseBlock(*result);
    if (h.number != it->second) {
      throw ChainClientError("eth_getBlockByNumber: asked for block " +
                             std::to_string(it->second) + ", got " +
                             std::to_string(h.number));
    }
    by_number[h.number] = h;
  }

  std::vector<Header> headers;
  headers.reserve(by_number.size());
  for (auto &[number, header] : by_number) {
    headers.push_back(header);
  }
  return headers;
}

uint256 RpcChainClient::EthCall(const ChainId &to, const std::string &data) {
  json call = {{"to", to.ToString()}, {"data", data}};
  json result = Call("eth_call", json::array({call, "latest"}));
  if (!result.is_string()) {
    throw ChainClientError("eth_call: result is not a string");
  }
  std::string hex = result.get<std::string>();
  // "0x" + at least one 32-byte word
  if (hex.size() < 2 + 64) {
    throw ChainClientError("eth_call: short return data");
  }
  auto word = uint256::FromHex(std::string_view(hex).substr(0, 2 + 64));
  if (!word) {
    throw ChainClientError("eth_call: bad return data");
  }
  return *word;
}

uint64_t RpcChainClient::GetLastRelayedBlock(const ChainId &bridge,
                                             const ChainId &bridged) {
  // Address argument, left-padded to 32 bytes
  std::string data = std::string("0x") + GET_LAST_BLOCK_SELECTOR +
                     std::string(24, '0') + bridged.GetHex();
  uint256 word = EthCall(bridge, data);

  for (size_t i = 0; i < 24; ++i) {
    if (word.data()[i] != 0) {
      throw ChainClientError("getLastBlock: value does not fit in 64 bits");
    }
  }
  uint64_t value = 0;
  for (size_t i = 24; i < 32; ++i) {
    value = (value << 8) | word.data()[i];
  }
  return value;
}

Address RpcChainClient::GetProposer(const ChainId &bridge) {
  uint256 word = EthCall(bridge, std::string("0x") + GET_PROPOSER_SELECTOR);
  // ABI address: 12 zero bytes then the 20-byte address
  return Address(std::span<const uint8_t>(word.data() + 12, 20));
}

} // namespace chain
} // namespace bridgerelay
