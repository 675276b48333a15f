// Loopback tests for the peer protocol server and broadcaster
#include <catch2/catch_test_macros.hpp>
#include "bridge/relay_manager.hpp"
#include "mock_chain_client.hpp"
#include "network/broadcaster.hpp"
#include "network/peer_server.hpp"
#include "test_helpers.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <thread>

using namespace bridgerelay;
using namespace bridgerelay::network;
using bridgerelay::test::MakeAddress;
using tcp = boost::asio::ip::tcp;

namespace {

// Server side of the protocol running on its own io thread
struct PeerNode {
    bridge::BridgeLinkRegistry links{nullptr};
    SignatureStore signatures;
    PeerDirectory peers{{"192.0.2.1:8000"}};
    boost::asio::io_context io;
    PeerMessageRouter router{links, signatures, peers, test::TestLogger("network")};
    std::unique_ptr<PeerServer> server;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard;
    std::thread thread;

    PeerNode() {
        // PROP frames only update pairs this node relays
        test::MockChainClient client;
        chain::RelayState state;
        REQUIRE(links.Refresh(MakeAddress(0x0a), MakeAddress(0x0b), client, state));

        server = std::make_unique<PeerServer>(io, router, test::TestLogger("network"));
        REQUIRE(server->Listen(0));
        REQUIRE(server->listening_port() != 0);
        guard.emplace(io.get_executor());
        thread = std::thread([this]() { io.run(); });
    }

    ~PeerNode() {
        server->Stop();
        guard.reset();
        io.stop();
        thread.join();
        server.reset();
    }

    uint16_t port() const { return server->listening_port(); }
};

// Blocking client connection
struct Client {
    boost::asio::io_context io;
    tcp::socket socket{io};
    boost::asio::streambuf buffer;

    explicit Client(uint16_t port) {
        socket.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port));
    }

    void Send(const std::string &data) { boost::asio::write(socket, boost::asio::buffer(data)); }

    std::string ReadLine() {
        size_t n = boost::asio::read_until(socket, buffer, '\n');
        std::string line(boost::asio::buffers_begin(buffer.data()),
                         boost::asio::buffers_begin(buffer.data()) + n);
        buffer.consume(n);
        return line;
    }
};

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

std::string PropFrame(uint8_t proposer) {
    return EncodePeerMessage(ProposerAnnouncement{MakeAddress(0x0a), MakeAddress(0x0b),
                                                  MakeAddress(proposer)});
}

} // namespace

TEST_CASE("PeerServer - request and reply on one connection", "[network][peer_server]") {
    PeerNode node;
    Client client(node.port());

    SECTION("PEERSREQ gets the peer list back") {
        client.Send("{\"type\":\"PEERSREQ\"}\n");
        auto reply = nlohmann::json::parse(client.ReadLine());
        REQUIRE(reply["type"] == "PEERS");
        REQUIRE(reply["peers"] == nlohmann::json::array({"192.0.2.1:8000"}));
    }

    SECTION("CRLF terminated frames are accepted") {
        client.Send("{\"type\":\"PEERSREQ\"}\r\n");
        auto reply = nlohmann::json::parse(client.ReadLine());
        REQUIRE(reply["type"] == "PEERS");
    }

    SECTION("Malformed frame does not close the connection") {
        client.Send("this is not json\n");
        client.Send("{\"type\":\"PEERSREQ\"}\n");
        auto reply = nlohmann::json::parse(client.ReadLine());
        REQUIRE(reply["type"] == "PEERS");
    }

    SECTION("Several frames in one write") {
        client.Send(PropFrame(0x07) + "{\"type\":\"PEERSREQ\"}\n");
        client.ReadLine();
        auto link = node.links.Get(MakeAddress(0x0a), MakeAddress(0x0b));
        REQUIRE(link.has_value());
        REQUIRE(link->proposer == MakeAddress(0x07));
    }

    SECTION("PROP for an unrelayed pair leaves the registry alone") {
        client.Send(EncodePeerMessage(ProposerAnnouncement{MakeAddress(0x0c), MakeAddress(0x0d),
                                                           MakeAddress(0x07)}) +
                    "{\"type\":\"PEERSREQ\"}\n");
        client.ReadLine();
        REQUIRE(node.links.Size() == 1);
        REQUIRE_FALSE(node.links.Get(MakeAddress(0x0c), MakeAddress(0x0d)).has_value());
    }
}

TEST_CASE("PeerServer - oversized frame closes the connection", "[network][peer_server]") {
    PeerNode node;
    Client client(node.port());

    std::string big(MAX_FRAME_SIZE + 16, 'x');
    boost::system::error_code ec;
    boost::asio::write(client.socket, boost::asio::buffer(big), ec);

    // The server hangs up without answering
    char byte;
    client.socket.read_some(boost::asio::buffer(&byte, 1), ec);
    REQUIRE(ec);
}

TEST_CASE("PeerServer - stop closes listener", "[network][peer_server]") {
    PeerNode node;
    uint16_t port = node.port();
    {
        Client client(port);
        REQUIRE(WaitFor([&] { return node.server->SessionCount() == 1; }));
    }
    node.server->Stop();
    REQUIRE(node.server->listening_port() == 0);

    boost::asio::io_context io;
    tcp::socket socket(io);
    boost::system::error_code ec;
    socket.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port), ec);
    REQUIRE(ec);
}

TEST_CASE("TcpBroadcaster - delivers frames to every peer", "[network][broadcaster]") {
    PeerNode first;
    PeerNode second;

    boost::asio::io_context io;
    auto guard = boost::asio::make_work_guard(io);
    std::thread runner([&io]() { io.run(); });

    PeerDirectory peers({"127.0.0.1:" + std::to_string(first.port()),
                         "127.0.0.1:" + std::to_string(second.port()),
                         "not-a-peer"});
    TcpBroadcaster broadcaster(io, peers, std::chrono::seconds(2), test::TestLogger("network"));

    broadcaster.Broadcast(PropFrame(0x09));

    auto announced = [](PeerNode &node) {
        auto link = node.links.Get(MakeAddress(0x0a), MakeAddress(0x0b));
        return link && link->proposer == MakeAddress(0x09);
    };
    REQUIRE(WaitFor([&] { return announced(first); }));
    REQUIRE(WaitFor([&] { return announced(second); }));

    SECTION("Unreachable peer is only logged") {
        uint16_t closed_port = 0;
        {
            tcp::acceptor scratch(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
            closed_port = scratch.local_endpoint().port();
        }
        REQUIRE_NOTHROW(broadcaster.SendTo("127.0.0.1:" + std::to_string(closed_port), PropFrame(0x0c)));
    }

    guard.reset();
    io.stop();
    runner.join();
}

TEST_CASE("PeerServer - answers while both chains sync slowly", "[network][peer_server]") {
    // One io thread serves every peer session
    PeerNode node;

    test::TempDir dir;
    const chain::ChainId chain_a = MakeAddress(0x0a);
    const chain::ChainId chain_b = MakeAddress(0x0b);
    chain::HeaderStore store(dir.path(), nullptr);
    chain::RelayState state;
    REQUIRE(store.Open(chain_a, state));
    REQUIRE(store.Open(chain_b, state));

    bridge::ProposalGate gate(node.links, store, 512, nullptr);
    TcpBroadcaster broadcaster(node.io, node.peers, std::chrono::seconds(1), nullptr);

    test::MockChainClient client_a;
    test::MockChainClient client_b;
    client_a.tip = client_b.tip = 100000;
    client_a.headers_delay = client_b.headers_delay = std::chrono::milliseconds(100);

    bridge::RelayManager::Config config;
    config.local_address = MakeAddress(0x01);
    bridge::RelayManager manager(store, node.links, gate, broadcaster, config,
                                 nullptr, nullptr);
    manager.AddChain(chain_a, chain_b, client_a);
    manager.AddChain(chain_b, chain_a, client_b);
    manager.Start();

    REQUIRE(WaitFor([&] { return client_a.headers_calls > 0 && client_b.headers_calls > 0; }));

    Client client(node.port());
    auto begin = std::chrono::steady_clock::now();
    client.Send("{\"type\":\"PEERSREQ\"}\n");
    auto reply = nlohmann::json::parse(client.ReadLine());
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(reply["type"] == "PEERS");
    REQUIRE(elapsed < std::chrono::milliseconds(500));
    REQUIRE(store.HighestStored(chain_a) < 100000);

    manager.Stop();
}
