// Unit tests for the header Merkle commitment
#include <catch2/catch_test_macros.hpp>
#include "chain/merkle.hpp"
#include "test_helpers.hpp"
#include "util/hash.hpp"
#include <algorithm>

using namespace bridgerelay;
using namespace bridgerelay::chain;
using bridgerelay::test::MakeHeader;
using bridgerelay::test::MakeHeaders;

TEST_CASE("SHA-256 primitive", "[merkle][hash]") {
    const std::string abc = "abc";
    auto digest = util::Sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t *>(abc.data()), abc.size()));
    REQUIRE(digest.GetHex() ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("ComputeHeaderRoot - shape", "[merkle]") {
    RelayState state;

    SECTION("Empty input is EMPTY_RANGE") {
        auto root = ComputeHeaderRoot({}, state);
        REQUIRE_FALSE(root.has_value());
        REQUIRE(state.GetCode() == RelayState::Code::EMPTY_RANGE);
    }

    SECTION("Single header root is its leaf hash") {
        auto h = MakeHeader(5);
        auto root = ComputeHeaderRoot({h}, state);
        REQUIRE(root.has_value());
        REQUIRE(*root == h.GetCommitmentHash());
    }

    SECTION("Two headers hash their pair") {
        auto a = MakeHeader(1);
        auto b = MakeHeader(2);
        auto root = ComputeHeaderRoot({a, b}, state);
        REQUIRE(root.has_value());
        REQUIRE(*root == util::Sha256Pair(a.GetCommitmentHash(), b.GetCommitmentHash()));
    }

    SECTION("Odd level duplicates its last node") {
        auto a = MakeHeader(1).GetCommitmentHash();
        auto b = MakeHeader(2).GetCommitmentHash();
        auto c = MakeHeader(3).GetCommitmentHash();
        auto expected = util::Sha256Pair(util::Sha256Pair(a, b), util::Sha256Pair(c, c));
        auto root = ComputeHeaderRoot(MakeHeaders(1, 3), state);
        REQUIRE(root.has_value());
        REQUIRE(*root == expected);
        REQUIRE(ComputeMerkleRoot({a, b, c}) == expected);
    }
}

TEST_CASE("ComputeHeaderRoot - determinism and sensitivity", "[merkle]") {
    RelayState state;
    auto headers = MakeHeaders(1, 256);
    auto root = ComputeHeaderRoot(headers, state);
    REQUIRE(root.has_value());

    SECTION("Same input, same root") {
        REQUIRE(ComputeHeaderRoot(headers, state) == root);
    }

    SECTION("Reordering changes the root") {
        auto swapped = headers;
        std::swap(swapped[10], swapped[11]);
        REQUIRE(ComputeHeaderRoot(swapped, state) != root);
    }

    SECTION("A single field change changes the root") {
        auto changed = headers;
        changed[200].receiptsRoot.data()[5] ^= 0x01;
        REQUIRE(ComputeHeaderRoot(changed, state) != root);
    }

    SECTION("Dropping a header changes the root") {
        auto shorter = headers;
        shorter.pop_back();
        REQUIRE(ComputeHeaderRoot(shorter, state) != root);
    }
}
