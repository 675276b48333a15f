// Unit tests for the per-chain relay loop
#include <catch2/catch_test_macros.hpp>
#include "bridge/relay_manager.hpp"
#include "chain/merkle.hpp"
#include "mock_chain_client.hpp"
#include "network/peer_message.hpp"
#include "test_helpers.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace bridgerelay;
using namespace bridgerelay::bridge;
using bridgerelay::chain::HeaderStore;
using bridgerelay::chain::RelayState;
using bridgerelay::test::MakeAddress;
using bridgerelay::test::MakeHeaders;
using bridgerelay::test::MockChainClient;
using bridgerelay::test::TempDir;

namespace {

// Captures frames instead of sending them
class RecordingBroadcaster : public network::Broadcaster {
public:
    void Broadcast(const std::string &frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(frame);
        cv_.notify_all();
    }

    std::vector<std::string> Frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

    bool WaitForFrames(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return frames_.size() >= count; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> frames_;
};

struct RelayFixture {
    TempDir dir;
    const ChainId chain_a = MakeAddress(0x0a);
    const ChainId chain_b = MakeAddress(0x0b);
    const Address local = MakeAddress(0x01);

    HeaderStore store{dir.path(), nullptr};
    BridgeLinkRegistry links{nullptr};
    ProposalGate gate{links, store, 512, nullptr};
    RecordingBroadcaster broadcaster;
    MockChainClient client_a;
    MockChainClient client_b;
    std::unique_ptr<RelayManager> manager;

    explicit RelayFixture(size_t max_batches = 10,
                          std::chrono::milliseconds query_delay = std::chrono::milliseconds(20)) {
        RelayState state;
        REQUIRE(store.Open(chain_a, state));
        REQUIRE(store.Open(chain_b, state));

        client_a.proposer = local;
        client_b.proposer = local;

        RelayManager::Config config;
        config.local_address = local;
        config.query_delay = query_delay;
        config.max_batches_per_tick = max_batches;
        manager = std::make_unique<RelayManager>(store, links, gate, broadcaster,
                                                 config, test::TestLogger("sync"),
                                                 test::TestLogger("bridge"));
        REQUIRE(manager->AddChain(chain_a, chain_b, client_a) == 0);
        REQUIRE(manager->AddChain(chain_b, chain_a, client_b) == 1);
    }
};

} // namespace

TEST_CASE("RelayManager - one cycle", "[relay_manager]") {
    RelayFixture f;
    REQUIRE(f.manager->ChainCount() == 2);

    SECTION("Below threshold syncs and refreshes without proposing") {
        f.client_a.tip = 300;
        f.client_a.last_relayed[{f.chain_a, f.chain_b}] = 0;

        CycleResult result = f.manager->RunCycle(0);
        REQUIRE(result.synced);
        REQUIRE(result.refreshed);
        REQUIRE_FALSE(result.proposal.has_value());
        REQUIRE(f.store.HighestStored(f.chain_a) == 300);
        REQUIRE(f.links.Get(f.chain_a, f.chain_b)->proposer == f.local);
        REQUIRE(f.broadcaster.Frames().empty());
    }

    SECTION("Eligible chain broadcasts one signature request") {
        f.client_a.tip = 613;
        f.client_a.last_relayed[{f.chain_a, f.chain_b}] = 100;

        CycleResult result = f.manager->RunCycle(0);
        REQUIRE(result.proposal.has_value());
        const auto &p = *result.proposal;
        REQUIRE(p.chain == f.chain_a);
        REQUIRE(p.start_block == 101);
        REQUIRE(p.end_block == 613);
        REQUIRE(p.proposer == f.local);

        RelayState state;
        auto expected_root = chain::ComputeHeaderRoot(MakeHeaders(101, 612), state);
        REQUIRE(expected_root.has_value());
        REQUIRE(p.merkle_root == *expected_root);

        auto frames = f.broadcaster.Frames();
        REQUIRE(frames.size() == 1);
        auto msg = network::DecodePeerMessage(frames[0].substr(0, frames[0].size() - 1), state);
        REQUIRE(msg.has_value());
        REQUIRE(std::get<network::SignatureRequest>(*msg).proposal.merkle_root == p.merkle_root);

        SECTION("Same range is not proposed twice") {
            CycleResult again = f.manager->RunCycle(0);
            REQUIRE_FALSE(again.proposal.has_value());
            REQUIRE(f.broadcaster.Frames().size() == 1);
        }

        SECTION("A new range after the bridge advances is proposed") {
            f.client_a.tip = 1200;
            f.client_a.last_relayed[{f.chain_a, f.chain_b}] = 612;
            CycleResult next = f.manager->RunCycle(0);
            REQUIRE(next.proposal.has_value());
            REQUIRE(next.proposal->start_block == 613);
            REQUIRE(f.broadcaster.Frames().size() == 2);
        }
    }

    SECTION("Not the proposer means no broadcast") {
        f.client_a.tip = 900;
        f.client_a.proposer = MakeAddress(0x02);
        CycleResult result = f.manager->RunCycle(0);
        REQUIRE(result.synced);
        REQUIRE_FALSE(result.proposal.has_value());
        REQUIRE(f.broadcaster.Frames().empty());
    }

    SECTION("Sync failure still refreshes and uses stored headers") {
        RelayState state;
        REQUIRE(f.store.Append(f.chain_a, MakeHeaders(1, 700), state));
        f.client_a.fail_headers = true;
        f.client_a.tip = 800;
        f.client_a.last_relayed[{f.chain_a, f.chain_b}] = 0;

        CycleResult result = f.manager->RunCycle(0);
        REQUIRE_FALSE(result.synced);
        REQUIRE(result.refreshed);
        REQUIRE(result.proposal.has_value());
        REQUIRE(result.proposal->end_block <= 700);
    }

    SECTION("Refresh failure keeps the old snapshot") {
        f.client_a.tip = 10;
        REQUIRE(f.manager->RunCycle(0).refreshed);
        f.client_a.fail_proposer = true;
        CycleResult result = f.manager->RunCycle(0);
        REQUIRE(result.synced);
        REQUIRE_FALSE(result.refreshed);
        REQUIRE(f.links.Get(f.chain_a, f.chain_b).has_value());
    }

    SECTION("Chains are independent") {
        f.client_b.tip = 40;
        f.manager->RunCycle(1);
        REQUIRE(f.store.HighestStored(f.chain_b) == 40);
        REQUIRE(f.store.HighestStored(f.chain_a) == 0);
        REQUIRE(f.links.Get(f.chain_b, f.chain_a).has_value());
        REQUIRE_FALSE(f.links.Get(f.chain_a, f.chain_b).has_value());
    }
}

TEST_CASE("RelayManager - scheduled loop", "[relay_manager]") {
    RelayFixture f;
    f.client_a.tip = 613;
    f.client_a.last_relayed[{f.chain_a, f.chain_b}] = 100;
    f.client_b.tip = 5;

    f.manager->Start();
    REQUIRE(f.manager->IsRunning());

    // First tick is immediate; the proposal arrives without waiting a delay
    REQUIRE(f.broadcaster.WaitForFrames(1, std::chrono::seconds(5)));

    // Let a few more ticks run; the range is not re-sent
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    f.manager->Stop();
    REQUIRE_FALSE(f.manager->IsRunning());

    REQUIRE(f.broadcaster.Frames().size() == 1);
    REQUIRE(f.client_a.block_number_calls >= 2);
    REQUIRE(f.store.HighestStored(f.chain_b) == 5);
}

TEST_CASE("RelayManager - sync is bounded per tick", "[relay_manager]") {
    RelayFixture f(2);
    f.client_a.tip = 450;

    CycleResult first = f.manager->RunCycle(0);
    REQUIRE(first.synced);
    REQUIRE_FALSE(first.caught_up);
    REQUIRE(first.refreshed);
    REQUIRE(f.store.HighestStored(f.chain_a) == 200);

    CycleResult second = f.manager->RunCycle(0);
    REQUIRE_FALSE(second.caught_up);
    REQUIRE(f.store.HighestStored(f.chain_a) == 400);

    CycleResult third = f.manager->RunCycle(0);
    REQUIRE(third.caught_up);
    REQUIRE(f.store.HighestStored(f.chain_a) == 450);

    SECTION("A chain already at the tip is caught up") {
        REQUIRE(f.manager->RunCycle(0).caught_up);
    }
}

TEST_CASE("RelayManager - catch-up ticks do not wait the query delay", "[relay_manager]") {
    RelayFixture f(1, std::chrono::seconds(10));
    f.client_a.tip = 500;

    f.manager->Start();
    // Five one-chunk ticks back to back, far sooner than one query delay
    bool done = false;
    for (int i = 0; i < 400 && !done; ++i) {
        done = f.store.HighestStored(f.chain_a) == 500;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    f.manager->Stop();
    REQUIRE(done);
}

TEST_CASE("RelayManager - stop interrupts a long sync", "[relay_manager]") {
    RelayFixture f(1000);
    f.client_a.tip = 100000;
    f.client_a.headers_delay = std::chrono::milliseconds(20);

    f.manager->Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(f.client_a.headers_calls > 0);

    auto begin = std::chrono::steady_clock::now();
    f.manager->Stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    // At most the chunk in flight finishes
    REQUIRE(elapsed < std::chrono::seconds(1));
    REQUIRE(f.store.HighestStored(f.chain_a) < 100000);
    uint64_t stored = f.store.HighestStored(f.chain_a);
    REQUIRE(stored % HeaderStore::BATCH_SIZE == 0);
}
