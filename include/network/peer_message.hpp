// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/proposal_gate.hpp"
#include "chain/relay_state.hpp"
#include "util/uint.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bridgerelay {
namespace network {

// Wire protocol: one JSON object per '\n'-terminated line,
// {"type": <command>, ...payload}
namespace commands {
constexpr const char *SIGREQ = "SIGREQ";     // Request to co-sign a proposal
constexpr const char *SIGPASS = "SIGPASS";   // Signature handed back
constexpr const char *PROP = "PROP";         // Proposer changed
constexpr const char *PEERSREQ = "PEERSREQ"; // Ask for the peer list
constexpr const char *PEERS = "PEERS";       // Reply to PEERSREQ
} // namespace commands

// Frames longer than this close the connection
constexpr size_t MAX_FRAME_SIZE = 1024 * 1024;

struct SignatureRequest {
  bridge::ProposalMessage proposal;
};

struct SignaturePass {
  uint256 merkle_root;
  chain::Address signer;
  std::string signature; // opaque, not verified
};

struct ProposerAnnouncement {
  chain::ChainId query_chain;
  chain::ChainId bridged_chain;
  chain::Address proposer;
};

struct PeersRequest {};

struct PeersReply {
  std::vector<std::string> peers;
};

// Any other type (treated as a heartbeat)
struct Unrecognized {
  std::string type;
};

using PeerMessage = std::variant<SignatureRequest, SignaturePass,
                                 ProposerAnnouncement, PeersRequest,
                                 PeersReply, Unrecognized>;

// Decode one frame (without its '\n'). Fails with MALFORMED_MESSAGE when the
// frame is not a JSON object with a string "type", or when a recognized type
// has a missing or malformed payload field.
std::optional<PeerMessage> DecodePeerMessage(std::string_view frame,
                                             chain::RelayState &state);

// Encode as a single line, '\n' included
std::string EncodePeerMessage(const PeerMessage &msg);

// Command string for a decoded message ("PING" style types keep their name)
std::string MessageType(const PeerMessage &msg);

} // namespace network
} // namespace bridgerelay
