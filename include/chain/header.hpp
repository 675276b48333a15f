// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bridgerelay {
namespace chain {

// A chain is identified by the address of its bridge contract
using ChainId = uint160;
// Wallet address of a relay participant
using Address = uint160;

// Header - minimal block metadata committed across the bridge
// Immutable once stored. Numbers are contiguous within a chain, starting at 1.
struct Header
{
    uint64_t number{0};
    uint64_t timestamp{0};
    uint256 prevHeaderHash{};
    uint256 txRoot{};
    uint256 receiptsRoot{};

    static constexpr size_t UINT256_BYTES = 32;

    // Commitment record: 8 + 8 + 32 + 32 + 32 = 112 bytes
    static constexpr size_t COMMITMENT_SIZE =
        8 +                          // number (big-endian)
        8 +                          // timestamp (big-endian)
        UINT256_BYTES +              // prevHeaderHash
        UINT256_BYTES +              // txRoot
        UINT256_BYTES;               // receiptsRoot

    static constexpr size_t OFF_NUMBER   = 0;
    static constexpr size_t OFF_TIME     = OFF_NUMBER + 8;
    static constexpr size_t OFF_PREV     = OFF_TIME + 8;
    static constexpr size_t OFF_TX       = OFF_PREV + UINT256_BYTES;
    static constexpr size_t OFF_RECEIPTS = OFF_TX + UINT256_BYTES;

    static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
    static_assert(OFF_RECEIPTS + UINT256_BYTES == COMMITMENT_SIZE, "offset math must be correct");

    using CommitmentBytes = std::array<uint8_t, COMMITMENT_SIZE>;

    // Fixed-size commitment record (scalars big-endian, hashes as stored)
    [[nodiscard]] CommitmentBytes SerializeCommitment() const noexcept;

    // SHA-256 of the commitment record (Merkle leaf)
    [[nodiscard]] uint256 GetCommitmentHash() const;

    // Header log record: number|timestamp|0xprev|0xtx|0xreceipts
    [[nodiscard]] std::string EncodeRecord() const;

    // Strict inverse of EncodeRecord()
    [[nodiscard]] static std::optional<Header> DecodeRecord(std::string_view record);

    [[nodiscard]] std::string ToString() const;

    friend bool operator==(const Header& a, const Header& b)
    {
        return a.number == b.number && a.timestamp == b.timestamp &&
               a.prevHeaderHash == b.prevHeaderHash && a.txRoot == b.txRoot &&
               a.receiptsRoot == b.receiptsRoot;
    }
    friend bool operator!=(const Header& a, const Header& b) { return !(a == b); }
};

} // namespace chain
} // namespace bridgerelay
