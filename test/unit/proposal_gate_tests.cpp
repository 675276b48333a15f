// Unit tests for the proposal eligibility gate
#include <catch2/catch_test_macros.hpp>
#include "bridge/proposal_gate.hpp"
#include "mock_chain_client.hpp"
#include "test_helpers.hpp"

using namespace bridgerelay;
using namespace bridgerelay::bridge;
using bridgerelay::chain::HeaderStore;
using bridgerelay::chain::RelayState;
using bridgerelay::test::MakeAddress;
using bridgerelay::test::MakeHeaders;
using bridgerelay::test::MockChainClient;
using bridgerelay::test::TempDir;

TEST_CASE("LargestPowerOfTwo", "[proposal_gate]") {
    REQUIRE(LargestPowerOfTwo(0) == 0);
    REQUIRE(LargestPowerOfTwo(1) == 1);
    REQUIRE(LargestPowerOfTwo(2) == 2);
    REQUIRE(LargestPowerOfTwo(3) == 2);
    REQUIRE(LargestPowerOfTwo(511) == 256);
    REQUIRE(LargestPowerOfTwo(512) == 512);
    REQUIRE(LargestPowerOfTwo(UINT64_MAX) == (uint64_t{1} << 63));
}

TEST_CASE("ProposalGate - eligibility", "[proposal_gate]") {
    TempDir dir;
    const ChainId query = MakeAddress(0x0a);
    const ChainId bridged = MakeAddress(0x0b);
    const Address local = MakeAddress(0x01);

    HeaderStore store(dir.path(), nullptr);
    BridgeLinkRegistry registry(nullptr);
    ProposalGate gate(registry, store, 512, test::TestLogger("bridge"));
    RelayState state;
    REQUIRE(store.Open(query, state));

    MockChainClient client;
    client.last_relayed[{query, bridged}] = 100;
    client.proposer = local;

    SECTION("Unknown bridge state") {
        REQUIRE(std::holds_alternative<NotEligible>(gate.TryPropose(query, bridged, local)));
    }

    REQUIRE(registry.Refresh(query, bridged, client, state));

    SECTION("One header short of the threshold") {
        REQUIRE(store.Append(query, MakeHeaders(1, 611), state));
        REQUIRE(std::holds_alternative<NotEligible>(gate.TryPropose(query, bridged, local)));
    }

    SECTION("Exactly the threshold proposes half") {
        REQUIRE(store.Append(query, MakeHeaders(1, 612), state));
        auto decision = gate.TryPropose(query, bridged, local);
        REQUIRE(std::holds_alternative<Eligible>(decision));
        const auto &range = std::get<Eligible>(decision).range;
        REQUIRE(range.chain == query);
        REQUIRE(range.start_block == 101);
        REQUIRE(range.end_block == 357);
        REQUIRE(range.Size() == 256);
    }

    SECTION("One past the threshold proposes the full power of two") {
        REQUIRE(store.Append(query, MakeHeaders(1, 613), state));
        auto decision = gate.TryPropose(query, bridged, local);
        REQUIRE(std::holds_alternative<Eligible>(decision));
        const auto &range = std::get<Eligible>(decision).range;
        REQUIRE(range.start_block == 101);
        REQUIRE(range.end_block == 613);
        REQUIRE(range.Size() == 512);
    }

    SECTION("Proposed range is always loadable") {
        REQUIRE(store.Append(query, MakeHeaders(1, 900), state));
        auto decision = gate.TryPropose(query, bridged, local);
        REQUIRE(std::holds_alternative<Eligible>(decision));
        const auto &range = std::get<Eligible>(decision).range;
        REQUIRE(range.end_block <= store.HighestStored(query));

        std::vector<chain::Header> headers;
        uint64_t highest = 0;
        REQUIRE(store.Load(query, range.start_block, range.end_block, headers, highest, state));
        REQUIRE(headers.size() == range.Size());
    }

    SECTION("Another node is the proposer") {
        REQUIRE(store.Append(query, MakeHeaders(1, 900), state));
        REQUIRE(std::holds_alternative<NotEligible>(gate.TryPropose(query, bridged, MakeAddress(0x02))));
    }

    SECTION("Announced proposer change takes effect") {
        REQUIRE(store.Append(query, MakeHeaders(1, 900), state));
        REQUIRE(registry.ApplyProposerAnnouncement(query, bridged, MakeAddress(0x02)));
        REQUIRE(std::holds_alternative<NotEligible>(gate.TryPropose(query, bridged, local)));
        REQUIRE(std::holds_alternative<Eligible>(gate.TryPropose(query, bridged, MakeAddress(0x02))));
    }

    SECTION("Store behind the bridge") {
        REQUIRE(store.Append(query, MakeHeaders(1, 50), state));
        auto decision = gate.TryPropose(query, bridged, local);
        REQUIRE(std::holds_alternative<NotEligible>(decision));
    }

    SECTION("Only the queried direction counts") {
        REQUIRE(store.Append(query, MakeHeaders(1, 900), state));
        REQUIRE(std::holds_alternative<NotEligible>(gate.TryPropose(bridged, query, local)));
    }
}

TEST_CASE("ProposalGate - minimum threshold", "[proposal_gate]") {
    TempDir dir;
    const ChainId query = MakeAddress(0x0c);
    const ChainId bridged = MakeAddress(0x0d);
    const Address local = MakeAddress(0x01);

    HeaderStore store(dir.path(), nullptr);
    BridgeLinkRegistry registry(nullptr);
    ProposalGate gate(registry, store, ProposalGate::MIN_THRESHOLD, nullptr);
    RelayState state;
    REQUIRE(store.Open(query, state));

    MockChainClient client;
    client.proposer = local;
    REQUIRE(registry.Refresh(query, bridged, client, state));

    SECTION("One pending header never proposes") {
        REQUIRE(store.Append(query, MakeHeaders(1, 1), state));
        REQUIRE(std::holds_alternative<NotEligible>(gate.TryPropose(query, bridged, local)));
    }

    SECTION("Two pending headers propose one") {
        REQUIRE(store.Append(query, MakeHeaders(1, 2), state));
        auto decision = gate.TryPropose(query, bridged, local);
        REQUIRE(std::holds_alternative<Eligible>(decision));
        REQUIRE(std::get<Eligible>(decision).range.start_block == 1);
        REQUIRE(std::get<Eligible>(decision).range.end_block == 2);
    }
}
