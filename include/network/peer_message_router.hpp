// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/bridge_link.hpp"
#include "chain/relay_state.hpp"
#include "network/peer_directory.hpp"
#include "network/peer_message.hpp"
#include "network/signature_store.hpp"
#include "util/logging.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace bridgerelay {
namespace network {

/**
 * PeerMessageRouter - decode a peer frame once, then dispatch by variant
 *
 *   SIGREQ   -> SignatureStore request queue (wallet picks it up)
 *   SIGPASS  -> SignatureStore, grouped by Merkle root
 *   PROP     -> BridgeLinkRegistry::ApplyProposerAnnouncement
 *   PEERSREQ -> reply with the PeerDirectory contents
 *   other    -> heartbeat, logged only
 *
 * Route() never throws; a bad frame fails with MALFORMED_MESSAGE and the
 * caller keeps the connection open.
 */
class PeerMessageRouter {
public:
  PeerMessageRouter(bridge::BridgeLinkRegistry &links,
                    SignatureStore &signatures, const PeerDirectory &peers,
                    util::LoggerPtr logger);

  // `reply` is set when the message must be answered on the same
  // connection (a full '\n'-terminated frame)
  bool Route(std::string_view frame, chain::RelayState &state,
             std::optional<std::string> &reply);

  // Dispatch an already decoded message
  void Dispatch(const PeerMessage &msg, std::optional<std::string> &reply);

private:
  bridge::BridgeLinkRegistry &links_;
  SignatureStore &signatures_;
  const PeerDirectory &peers_;
  util::LoggerPtr logger_;
};

} // namespace network
} // namespace bridgerelay
