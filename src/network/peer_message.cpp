// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_message.hpp"
#include <nlohmann/json.hpp>

namespace bridgerelay {
namespace network {

using json = nlohmann::json;
using chain::RelayState;

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Field readers, std::nullopt on a missing or malformed field
std::optional<uint160> ReadAddress(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return uint160::FromHex(it->get<std::string>());
}

std::optional<uint256> ReadHash(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return uint256::FromHex(it->get<std::string>());
}

std::optional<uint64_t> ReadBlock(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_unsigned()) {
    return std::nullopt;
  }
  return it->get<uint64_t>();
}

void Malformed(RelayState &state, const std::string &type,
               const char *field) {
  state.Fail(RelayState::Code::MALFORMED_MESSAGE, "bad-payload",
             type + ": missing or invalid '" + field + "'");
}

} // namespace

std::optional<PeerMessage> DecodePeerMessage(std::string_view frame,
                                             RelayState &state) {
  if (frame.size() > MAX_FRAME_SIZE) {
    state.Fail(RelayState::Code::MALFORMED_MESSAGE, "oversized-frame",
               std::to_string(frame.size()) + " bytes");
    return std::nullopt;
  }

  json obj = json::parse(frame, nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) {
    state.Fail(RelayState::Code::MALFORMED_MESSAGE, "not-json-object");
    return std::nullopt;
  }
  auto type_it = obj.find("type");
  if (type_it == obj.end() || !type_it->is_string()) {
    state.Fail(RelayState::Code::MALFORMED_MESSAGE, "missing-type");
    return std::nullopt;
  }
  const std::string type = type_it->get<std::string>();

  if (type == commands::SIGREQ) {
    auto chain = ReadAddress(obj, "chain");
    auto start = ReadBlock(obj, "startBlock");
    auto end = ReadBlock(obj, "endBlock");
    auto root = ReadHash(obj, "merkleRoot");
    auto proposer = ReadAddress(obj, "proposer");
    if (!chain) { Malformed(state, type, "chain"); return std::nullopt; }
    if (!start) { Malformed(state, type, "startBlock"); return std::nullopt; }
    if (!end) { Malformed(state, type, "endBlock"); return std::nullopt; }
    if (!root) { Malformed(state, type, "merkleRoot"); return std::nullopt; }
    if (!proposer) { Malformed(state, type, "proposer"); return std::nullopt; }

    SignatureRequest msg;
    msg.proposal.chain = *chain;
    msg.proposal.start_block = *start;
    msg.proposal.end_block = *end;
    msg.proposal.merkle_root = *root;
    msg.proposal.proposer = *proposer;
    return msg;
  }

  if (type == commands::SIGPASS) {
    auto root = ReadHash(obj, "merkleRoot");
    auto signer = ReadAddress(obj, "signer");
    auto sig = obj.find("signature");
    if (!root) { Malformed(state, type, "merkleRoot"); return std::nullopt; }
    if (!signer) { Malformed(state, type, "signer"); return std::nullopt; }
    if (sig == obj.end() || !sig->is_string()) {
      Malformed(state, type, "signature");
      return std::nullopt;
    }
    return SignaturePass{*root, *signer, sig->get<std::string>()};
  }

  if (type == commands::PROP) {
    auto query = ReadAddress(obj, "queryChain");
    auto bridged = ReadAddress(obj, "bridgedChain");
    auto proposer = ReadAddress(obj, "proposer");
    if (!query) { Malformed(state, type, "queryChain"); return std::nullopt; }
    if (!bridged) { Malformed(state, type, "bridgedChain"); return std::nullopt; }
    if (!proposer) { Malformed(state, type, "proposer"); return std::nullopt; }
    return ProposerAnnouncement{*query, *bridged, *proposer};
  }

  if (type == commands::PEERSREQ) {
    return PeersRequest{};
  }

  if (type == commands::PEERS) {
    auto peers = obj.find("peers");
    if (peers == obj.end() || !peers->is_array()) {
      Malformed(state, type, "peers");
      return std::nullopt;
    }
    PeersReply reply;
    for (const auto &p : *peers) {
      if (!p.is_string()) {
        Malformed(state, type, "peers");
        return std::nullopt;
      }
      reply.peers.push_back(p.get<std::string>());
    }
    return reply;
  }

  return Unrecognized{type};
}

std::string EncodePeerMessage(const PeerMessage &msg) {
  json obj = std::visit(
      overloaded{
          [](const SignatureRequest &m) {
            return json{{"type", commands::SIGREQ},
                        {"chain", m.proposal.chain.ToString()},
                        {"startBlock", m.proposal.start_block},
                        {"endBlock", m.proposal.end_block},
                        {"merkleRoot", m.proposal.merkle_root.ToString()},
                        {"proposer", m.proposal.proposer.ToString()}};
          },
          [](const SignaturePass &m) {
            return json{{"type", commands::SIGPASS},
                        {"merkleRoot", m.merkle_root.ToString()},
                        {"signer", m.signer.ToString()},
                        {"signature", m.signature}};
          },
          [](const ProposerAnnouncement &m) {
            return json{{"type", commands::PROP},
                        {"queryChain", m.query_chain.ToString()},
                        {"bridgedChain", m.bridged_chain.ToString()},
                        {"proposer", m.proposer.ToString()}};
          },
          [](const PeersRequest &) {
            return json{{"type", commands::PEERSREQ}};
          },
          [](const PeersReply &m) {
            return json{{"type", commands::PEERS}, {"peers", m.peers}};
          },
          [](const Unrecognized &m) { return json{{"type", m.type}}; },
      },
      msg);
  return obj.dump() + "\n";
}

std::string MessageType(const PeerMessage &msg) {
  return std::visit(
      overloaded{
          [](const SignatureRequest &) { return std::string(commands::SIGREQ); },
          [](const SignaturePass &) { return std::string(commands::SIGPASS); },
          [](const ProposerAnnouncement &) { return std::string(commands::PROP); },
          [](const PeersRequest &) { return std::string(commands::PEERSREQ); },
          [](const PeersReply &) { return std::string(commands::PEERS); },
          [](const Unrecognized &m) { return m.type; },
      },
      msg);
}

} // namespace network
} // namespace bridgerelay
