// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_message_router.hpp"
#include <type_traits>

namespace bridgerelay {
namespace network {

PeerMessageRouter::PeerMessageRouter(bridge::BridgeLinkRegistry &links,
                                     SignatureStore &signatures,
                                     const PeerDirectory &peers,
                                     util::LoggerPtr logger)
    : links_(links), signatures_(signatures), peers_(peers),
      logger_(util::OrNullLogger(std::move(logger))) {}

bool PeerMessageRouter::Route(std::string_view frame,
                              chain::RelayState &state,
                              std::optional<std::string> &reply) {
  reply.reset();

  auto msg = DecodePeerMessage(frame, state);
  if (!msg) {
    logger_->warn("Dropping malformed peer message: {}", state.ToString());
    return false;
  }

  logger_->trace("Received {}", MessageType(*msg));
  Dispatch(*msg, reply);
  return true;
}

void PeerMessageRouter::Dispatch(const PeerMessage &msg,
                                 std::optional<std::string> &reply) {
  std::visit(
      [&](const auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SignatureRequest>) {
          logger_->info("Signature request for {} blocks {}..{} root {}",
                        m.proposal.chain.ToString(), m.proposal.start_block,
                        m.proposal.end_block, m.proposal.merkle_root.ToString());
          signatures_.AddRequest(m.proposal);
        } else if constexpr (std::is_same_v<T, SignaturePass>) {
          logger_->info("Signature from {} for root {}", m.signer.ToString(),
                        m.merkle_root.ToString());
          if (!signatures_.AddSignature(m.merkle_root,
                                        StoredSignature{m.signer, m.signature})) {
            logger_->warn("Dropping signature from {}: root {} has too many signers",
                          m.signer.ToString(), m.merkle_root.ToString());
          }
        } else if constexpr (std::is_same_v<T, ProposerAnnouncement>) {
          if (!links_.ApplyProposerAnnouncement(m.query_chain, m.bridged_chain,
                                                m.proposer)) {
            logger_->debug("PROP for unrelayed pair {} -> {} dropped",
                           m.query_chain.ToString(), m.bridged_chain.ToString());
          }
        } else if constexpr (std::is_same_v<T, PeersRequest>) {
          reply = EncodePeerMessage(PeersReply{peers_.GetPeers()});
        } else if constexpr (std::is_same_v<T, PeersReply>) {
          logger_->debug("Peer list with {} entries ignored", m.peers.size());
        } else {
          static_assert(std::is_same_v<T, Unrecognized>, "unhandled message");
          logger_->debug("Ping ({})", m.type);
        }
      },
      msg);
}

} // namespace network
} // namespace bridgerelay
