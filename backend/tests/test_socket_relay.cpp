#include <doctest/doctest.h>
#include "network/socket_relay.h"
#include "protocol/envelope.h"
#include "test_support.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace beacon;
using namespace beacon::testing;
using namespace std::chrono_literals;

namespace {

RelayConfig fast_config(std::string local_id, uint16_t port) {
    RelayConfig cfg;
    cfg.local_id = std::move(local_id);
    cfg.port = port;
    cfg.settle_delay = 10ms;
    cfg.connect_attempts = 3;
    cfg.backoff_step = 20ms;
    cfg.connect_timeout = 500ms;
    return cfg;
}

std::string chat_line(const std::string& sender, const std::string& text) {
    ChatMessage m;
    m.sender_id = sender;
    m.sender_name = sender;
    m.text = text;
    m.timestamp = std::chrono::system_clock::now();
    return envelope::serialize(m);
}

/// Coordinator and client relays on separate buses, joined over loopback.
struct Pair {
    asio::io_context io;
    EventBus bus_a;
    EventBus bus_b;
    RelayRecorder rec_a{bus_a};
    RelayRecorder rec_b{bus_b};
    SocketRelay a;
    SocketRelay b;

    explicit Pair(uint16_t port)
        : a(io, bus_a, fast_config("dev-a", port)),
          b(io, bus_b, fast_config("dev-b", port)) {}

    bool open() {
        bus_a.topology.publish(coordinator_topology());
        auto client = client_topology();
        bus_b.topology.publish(client);
        return run_until(io, [&] { return a.is_open() && b.is_open(); });
    }
};

asio::ip::tcp::endpoint loopback(uint16_t port) {
    return asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port);
}

void write_raw(asio::ip::tcp::socket& socket, const std::string& line) {
    asio::write(socket, asio::buffer(line + "\n"));
}

} // namespace

TEST_CASE("Client gives up after bounded retries with one SocketConnectFailed") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    // Nothing listens on this port.
    SocketRelay relay(io, bus, fast_config("dev-b", 38471));

    bus.topology.publish(client_topology());
    CHECK(relay.state() == RelayState::Idle);

    REQUIRE(run_until(io, [&] { return rec.count<events::SocketConnectFailed>() > 0; }));
    run_for(io, 100ms);

    CHECK(rec.count<events::SocketConnectFailed>() == 1);
    CHECK(rec.count<events::SocketConnected>() == 0);
    CHECK(relay.state() == RelayState::Idle);
    CHECK(relay.role() == RelayRole::None);
    CHECK(rec.state_count(RelayState::Connecting) == 1);

    const auto& failed = std::get<events::SocketConnectFailed>(
        *std::find_if(rec.socket.begin(), rec.socket.end(), [](const events::SocketEvent& e) {
            return std::holds_alternative<events::SocketConnectFailed>(e);
        }));
    CHECK(failed.address == "127.0.0.1");
    CHECK_FALSE(failed.reason.empty());
}

TEST_CASE("Client topology without a coordinator address is ignored") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    SocketRelay relay(io, bus, fast_config("dev-b", 38472));

    events::TopologyChanged change;
    change.connected = true;
    bus.topology.publish(change);
    run_for(io, 50ms);

    CHECK(relay.state() == RelayState::Idle);
    CHECK(rec.socket.empty());
}

TEST_CASE("Coordinator listens once and repeated topology updates are no-ops") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    SocketRelay relay(io, bus, fast_config("dev-a", 38473));

    bus.topology.publish(coordinator_topology());
    REQUIRE(run_until(io, [&] { return relay.state() == RelayState::Listening; }));
    CHECK(relay.role() == RelayRole::Listener);
    CHECK(relay.listening_port() == 38473);

    bus.topology.publish(coordinator_topology());
    run_for(io, 50ms);
    CHECK(relay.state() == RelayState::Listening);
    CHECK(rec.state_count(RelayState::Listening) == 1);

    relay.stop();
    CHECK(relay.state() == RelayState::Idle);
    CHECK(rec.count<events::SocketDisconnected>() == 1);
}

TEST_CASE("Coordinator reports SocketConnectFailed when the port stays taken") {
    asio::io_context io;
    asio::ip::tcp::acceptor blocker(io, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), 38474));

    EventBus bus;
    RelayRecorder rec(bus);
    SocketRelay relay(io, bus, fast_config("dev-a", 38474));

    bus.topology.publish(coordinator_topology());
    REQUIRE(run_until(io, [&] { return rec.count<events::SocketConnectFailed>() > 0; }));
    run_for(io, 50ms);

    CHECK(rec.count<events::SocketConnectFailed>() == 1);
    CHECK(relay.state() == RelayState::Idle);
    CHECK(std::get<events::SocketConnectFailed>(rec.socket.back()).address == "0.0.0.0:38474");
}

TEST_CASE("send before the stream is open returns NotConnected") {
    asio::io_context io;
    EventBus bus;
    SocketRelay relay(io, bus, fast_config("dev-a", 38475));

    bool called = false;
    Status status = relay.send("hello", [&](const Status&) { called = true; });
    CHECK(status.code() == ErrorCode::NotConnected);
    run_for(io, 20ms);
    CHECK_FALSE(called);
}

TEST_CASE("Coordinator and client exchange envelopes in both directions") {
    Pair p(38476);
    REQUIRE(p.open());

    CHECK(p.a.role() == RelayRole::Listener);
    CHECK(p.b.role() == RelayRole::Connector);
    CHECK(p.rec_a.count<events::SocketConnected>() == 1);
    CHECK(p.rec_b.count<events::SocketConnected>() == 1);
    CHECK(p.b.remote_address() == "127.0.0.1");

    Status delivered(ErrorCode::SendFailed);
    REQUIRE(p.b.send(chat_line("dev-b", "hello"), [&](const Status& s) { delivered = s; }).ok());
    REQUIRE(run_until(p.io, [&] { return !p.rec_a.received.empty(); }));
    CHECK(delivered.ok());

    const auto& got = p.rec_a.received.front();
    CHECK(got.message.text == "hello");
    CHECK(got.message.sender_id == "dev-b");
    CHECK_FALSE(got.message.from_current_user);
    CHECK_FALSE(got.plain_text);

    REQUIRE(p.a.send("plain words").ok());
    REQUIRE(run_until(p.io, [&] { return !p.rec_b.received.empty(); }));
    CHECK(p.rec_b.received.front().plain_text);
    CHECK(p.rec_b.received.front().message.text == "plain words");
    CHECK(p.rec_b.received.front().message.sender_id == "127.0.0.1");
}

TEST_CASE("Topology loss closes the stream once and drops later input") {
    Pair p(38477);
    REQUIRE(p.open());

    p.bus_b.topology.publish(events::TopologyChanged{});
    CHECK(p.b.state() == RelayState::Idle);
    CHECK(p.rec_b.count<events::SocketDisconnected>() == 1);

    // Coordinator notices the closed stream and keeps accepting.
    REQUIRE(run_until(p.io, [&] { return p.rec_a.count<events::SocketDisconnected>() == 1; }));
    CHECK(p.a.state() == RelayState::Listening);
    CHECK(p.a.send("too late").code() == ErrorCode::NotConnected);

    p.bus_b.topology.publish(events::TopologyChanged{});
    run_for(p.io, 50ms);
    CHECK(p.rec_b.count<events::SocketDisconnected>() == 1);
    CHECK(p.rec_b.received.empty());
    CHECK(p.b.send("x").code() == ErrorCode::NotConnected);
}

TEST_CASE("Client reconnects to a coordinator that is still listening") {
    Pair p(38478);
    REQUIRE(p.open());

    p.bus_b.topology.publish(events::TopologyChanged{});
    REQUIRE(run_until(p.io, [&] { return p.a.state() == RelayState::Listening; }));

    p.bus_b.topology.publish(client_topology());
    REQUIRE(run_until(p.io, [&] { return p.a.is_open() && p.b.is_open(); }));
    CHECK(p.rec_a.count<events::SocketConnected>() == 2);
}

TEST_CASE("A second inbound connection is read but never written to") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    SocketRelay relay(io, bus, fast_config("dev-a", 38490));
    bus.topology.publish(coordinator_topology());
    REQUIRE(run_until(io, [&] { return relay.state() == RelayState::Listening; }));

    asio::ip::tcp::socket first(io);
    first.connect(loopback(38490));
    REQUIRE(run_until(io, [&] { return relay.is_open(); }));

    asio::ip::tcp::socket second(io);
    second.connect(loopback(38490));
    run_for(io, 50ms);
    CHECK(relay.is_open());
    CHECK(rec.count<events::SocketConnected>() == 1);

    write_raw(first, chat_line("dev-b", "from first"));
    write_raw(second, chat_line("dev-c", "from second"));
    REQUIRE(run_until(io, [&] { return rec.received.size() == 2; }));
    auto has_text = [&](const std::string& text) {
        return std::any_of(rec.received.begin(), rec.received.end(),
                           [&](const events::MessageReceived& r) { return r.message.text == text; });
    };
    CHECK(has_text("from first"));
    CHECK(has_text("from second"));

    bool done = false;
    REQUIRE(relay.send(chat_line("dev-a", "reply"), [&](const Status& s) { done = s.ok(); }).ok());
    REQUIRE(run_until(io, [&] { return done && first.available() > 0; }));
    asio::error_code ec;
    CHECK(second.available(ec) == 0);

    // The extra connection ending leaves the serviced stream alone.
    second.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    second.close(ec);
    run_for(io, 50ms);
    CHECK(relay.is_open());
    CHECK(rec.count<events::SocketDisconnected>() == 0);

    const auto before = first.available();
    done = false;
    REQUIRE(relay.send(chat_line("dev-a", "still here"), [&](const Status& s) { done = s.ok(); }).ok());
    REQUIRE(run_until(io, [&] { return done && first.available() > before; }));

    relay.stop();
    CHECK(rec.count<events::SocketDisconnected>() == 1);
}

TEST_CASE("Bytes buffered before topology loss are never delivered") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    asio::ip::tcp::acceptor coordinator(io, loopback(38491));
    asio::ip::tcp::socket accepted(io);
    bool accepted_ok = false;
    coordinator.async_accept(accepted, [&](const asio::error_code& ec) { accepted_ok = !ec; });

    SocketRelay relay(io, bus, fast_config("dev-b", 38491));
    bus.topology.publish(client_topology());
    REQUIRE(run_until(io, [&] { return accepted_ok && relay.is_open(); }));

    // The line reaches the relay's socket, then the radio drops before it is read.
    write_raw(accepted, chat_line("dev-a", "stale"));
    std::this_thread::sleep_for(20ms);
    bus.topology.publish(events::TopologyChanged{});
    CHECK(relay.state() == RelayState::Idle);

    run_for(io, 50ms);
    CHECK(rec.received.empty());
    CHECK(rec.count<events::SocketDisconnected>() == 1);
}

TEST_CASE("Topology loss during the settle delay cancels the pending connect") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    auto cfg = fast_config("dev-b", 38492);
    cfg.settle_delay = 200ms;
    SocketRelay relay(io, bus, cfg);

    bus.topology.publish(client_topology());
    bus.topology.publish(events::TopologyChanged{});
    CHECK(rec.count<events::SocketDisconnected>() == 1);
    CHECK(relay.state() == RelayState::Idle);

    run_for(io, 300ms);
    CHECK(rec.count<events::SocketDisconnected>() == 1);
    CHECK(rec.count<events::SocketConnected>() == 0);
    CHECK(rec.count<events::SocketConnectFailed>() == 0);
    CHECK(rec.state_count(RelayState::Connecting) == 0);
    CHECK(relay.state() == RelayState::Idle);
}

TEST_CASE("Topology loss during the retry backoff stops further attempts") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    // Nothing listens on this port.
    auto cfg = fast_config("dev-b", 38493);
    cfg.backoff_step = 200ms;
    SocketRelay relay(io, bus, cfg);

    bus.topology.publish(client_topology());
    REQUIRE(run_until(io, [&] { return relay.state() == RelayState::Connecting; }));
    run_for(io, 60ms);
    REQUIRE(relay.state() == RelayState::Connecting);
    REQUIRE(rec.count<events::SocketConnectFailed>() == 0);

    bus.topology.publish(events::TopologyChanged{});
    CHECK(rec.count<events::SocketDisconnected>() == 1);
    CHECK(relay.state() == RelayState::Idle);

    run_for(io, 600ms);
    CHECK(rec.count<events::SocketDisconnected>() == 1);
    CHECK(rec.count<events::SocketConnectFailed>() == 0);
    CHECK(rec.count<events::SocketConnected>() == 0);
    CHECK(relay.state() == RelayState::Idle);
}

TEST_CASE("Writing to a stream the peer has reset reports SendFailed") {
    asio::io_context io;
    EventBus bus;
    RelayRecorder rec(bus);
    SocketRelay relay(io, bus, fast_config("dev-a", 38494));
    bus.topology.publish(coordinator_topology());
    REQUIRE(run_until(io, [&] { return relay.state() == RelayState::Listening; }));

    asio::ip::tcp::socket peer(io);
    peer.connect(loopback(38494));
    REQUIRE(run_until(io, [&] { return relay.is_open(); }));

    // Abortive close: the relay's socket sees a reset, not an orderly EOF.
    peer.set_option(asio::socket_base::linger(true, 0));
    peer.close();
    std::this_thread::sleep_for(20ms);

    bool called = false;
    Status result;
    REQUIRE(relay.send("anyone there?", [&](const Status& s) {
        called = true;
        result = s;
    }).ok());
    REQUIRE(run_until(io, [&] { return called; }));
    CHECK(result.code() == ErrorCode::SendFailed);
    CHECK_FALSE(result.reason().empty());
}
