// Unit tests for HeaderSyncer against a scripted chain client
#include <catch2/catch_test_macros.hpp>
#include "chain/header_syncer.hpp"
#include "mock_chain_client.hpp"
#include "test_helpers.hpp"

using namespace bridgerelay;
using namespace bridgerelay::chain;
using bridgerelay::test::MakeAddress;
using bridgerelay::test::MakeHeaders;
using bridgerelay::test::MockChainClient;
using bridgerelay::test::TempDir;

TEST_CASE("HeaderSyncer - catches up in batches", "[header_syncer]") {
    TempDir dir;
    const ChainId chain = MakeAddress(0x01);
    HeaderStore store(dir.path(), nullptr);
    HeaderSyncer syncer(store, test::TestLogger("sync"));
    MockChainClient client;
    RelayState state;
    REQUIRE(store.Open(chain, state));

    SECTION("Fresh chain syncs from block 1") {
        client.tip = 250;
        REQUIRE(syncer.Sync(chain, client, state));
        REQUIRE(store.HighestStored(chain) == 250);
        const std::vector<std::pair<uint64_t, uint64_t>> expected{{1, 100}, {101, 200}, {201, 250}};
        REQUIRE(client.header_requests == expected);
    }

    SECTION("Resumes from the highest stored block") {
        REQUIRE(store.Append(chain, MakeHeaders(1, 130), state));
        client.tip = 140;
        REQUIRE(syncer.Sync(chain, client, state));
        REQUIRE(store.HighestStored(chain) == 140);
        REQUIRE(client.header_requests.size() == 1);
        REQUIRE(client.header_requests[0].first == 131);
        REQUIRE(client.header_requests[0].second == 140);
    }

    SECTION("Up to date chain makes no header request") {
        client.tip = 20;
        REQUIRE(syncer.Sync(chain, client, state));
        client.header_requests.clear();
        REQUIRE(syncer.Sync(chain, client, state));
        REQUIRE(client.header_requests.empty());
        REQUIRE(client.block_number_calls == 2);
    }

    SECTION("Endpoint behind the store is not an error") {
        REQUIRE(store.Append(chain, MakeHeaders(1, 50), state));
        client.tip = 10;
        REQUIRE(syncer.Sync(chain, client, state));
        REQUIRE(store.HighestStored(chain) == 50);
    }
}

TEST_CASE("HeaderSyncer - client failures become SYNC_ERROR", "[header_syncer]") {
    TempDir dir;
    const ChainId chain = MakeAddress(0x02);
    HeaderStore store(dir.path(), nullptr);
    HeaderSyncer syncer(store, nullptr);
    MockChainClient client;
    client.tip = 150;
    RelayState state;
    REQUIRE(store.Open(chain, state));

    SECTION("Block number query fails") {
        client.fail_block_number = true;
        REQUIRE_FALSE(syncer.Sync(chain, client, state));
        REQUIRE(state.GetCode() == RelayState::Code::SYNC_ERROR);
        REQUIRE(store.HighestStored(chain) == 0);
    }

    SECTION("Header query fails") {
        client.fail_headers = true;
        REQUIRE_FALSE(syncer.Sync(chain, client, state));
        REQUIRE(state.GetCode() == RelayState::Code::SYNC_ERROR);
        REQUIRE(store.HighestStored(chain) == 0);
    }

    SECTION("Short reply is rejected before storing") {
        client.truncate_headers = 3;
        REQUIRE_FALSE(syncer.Sync(chain, client, state));
        REQUIRE(state.GetCode() == RelayState::Code::SYNC_ERROR);
        REQUIRE(store.HighestStored(chain) == 0);
    }

    SECTION("Next tick recovers") {
        client.fail_headers = true;
        REQUIRE_FALSE(syncer.Sync(chain, client, state));
        client.fail_headers = false;
        state.Reset();
        REQUIRE(syncer.Sync(chain, client, state));
        REQUIRE(store.HighestStored(chain) == 150);
    }
}

TEST_CASE("HeaderSyncer - bounded and interruptible", "[header_syncer]") {
    TempDir dir;
    const ChainId chain = MakeAddress(0x03);
    HeaderStore store(dir.path(), nullptr);
    MockChainClient client;
    RelayState state;
    REQUIRE(store.Open(chain, state));
    client.tip = 350;

    SECTION("Batch cap stops early and the next call resumes") {
        HeaderSyncer syncer(store, nullptr, 2);
        bool caught_up = true;
        REQUIRE(syncer.Sync(chain, client, state, nullptr, &caught_up));
        REQUIRE_FALSE(caught_up);
        REQUIRE(store.HighestStored(chain) == 200);

        REQUIRE(syncer.Sync(chain, client, state, nullptr, &caught_up));
        REQUIRE(caught_up);
        REQUIRE(store.HighestStored(chain) == 350);
        REQUIRE(client.header_requests.back().first == 301);
    }

    SECTION("keep_going is checked before every chunk") {
        HeaderSyncer syncer(store, nullptr);
        int chunks = 0;
        bool caught_up = true;
        REQUIRE(syncer.Sync(chain, client, state, [&]() { return chunks++ < 1; },
                            &caught_up));
        REQUIRE_FALSE(caught_up);
        REQUIRE(store.HighestStored(chain) == 100);
        REQUIRE(client.header_requests.size() == 1);
    }

    SECTION("Stop before the first chunk fetches nothing") {
        HeaderSyncer syncer(store, nullptr);
        REQUIRE(syncer.Sync(chain, client, state, []() { return false; }));
        REQUIRE(store.HighestStored(chain) == 0);
        REQUIRE(client.header_requests.empty());
    }
}
