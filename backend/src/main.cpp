/**
 * beacon-node - Backend Entry Point
 *
 * Loads config and the device identity, wires the event bus, transport,
 * peer directory, socket relay and node together, then runs the io_context
 * until SIGINT/SIGTERM or /quit.
 *
 * stdin commands:
 *   /peers            list known peers
 *   /connect <id>     request a radio join with a discovered peer
 *   /disconnect       tear the topology down
 *   /history          print the message log
 *   /quit             exit
 *   anything else     send as a chat message
 */

#include <functional>
#include <iostream>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/node_config.h"
#include "core/events.h"
#include "directory/peer_directory.h"
#include "identity/device_identity.h"
#include "network/socket_relay.h"
#include "node/node.h"
#include "protocol/timestamp.h"
#include "transport/simulated_transport.h"

using namespace beacon;

namespace {

/// Traces every bus event at debug level, notification kinds at info.
class EventLogger {
public:
    explicit EventLogger(EventBus& bus) {
        subs_.push_back(bus.discovery.subscribe([](const events::DiscoveryEvent& e) {
            spdlog::debug("[discovery] {}", events::describe(e));
        }));
        subs_.push_back(bus.topology.subscribe([](const events::TopologyChanged& e) {
            spdlog::info("[topology] {}", events::describe(e));
        }));
        subs_.push_back(bus.directory.subscribe([](const events::DirectoryEvent& e) {
            const std::string kind = events::notification_kind(e);
            if (kind.empty()) {
                spdlog::debug("[directory] {}", events::describe(e));
            } else {
                spdlog::info("[{}] {}", kind, events::describe(e));
            }
        }));
        subs_.push_back(bus.socket.subscribe([](const events::SocketEvent& e) {
            spdlog::info("[socket] {}", events::describe(e));
        }));
        subs_.push_back(bus.message.subscribe([](const events::MessageEvent& e) {
            spdlog::debug("[message] {}", events::describe(e));
        }));
    }

private:
    std::vector<Subscription> subs_;
};

class Console {
public:
    Console(asio::io_context& io, Node& node, std::function<void()> on_quit)
        : input_(io, ::dup(STDIN_FILENO)), node_(node), on_quit_(std::move(on_quit)) {}

    void start() { read_line(); }

    void stop() {
        asio::error_code ec;
        input_.close(ec);
    }

private:
    void read_line() {
        asio::async_read_until(input_, buffer_, '\n',
            [this](const asio::error_code& ec, std::size_t /*length*/) {
                if (ec) {
                    if (ec != asio::error::operation_aborted) {
                        spdlog::info("stdin closed, shutting down");
                        on_quit_();
                    }
                    return;
                }
                std::istream is(&buffer_);
                std::string line;
                std::getline(is, line);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                handle(line);
                if (input_.is_open()) read_line();
            });
    }

    void handle(const std::string& line) {
        if (line.empty()) return;

        if (line == "/quit") {
            on_quit_();
        } else if (line == "/peers") {
            for (const auto& p : node_.peers()) {
                std::cout << p.id << "  " << p.name << "  " << to_string(p.status)
                          << "  signal=" << p.signal_quality
                          << (p.emergency ? "  [EMERGENCY]" : "") << '\n';
            }
        } else if (line.rfind("/connect ", 0) == 0) {
            Status status = node_.connect_to_peer(line.substr(9));
            std::cout << (status ? "join requested" : status.message()) << '\n';
        } else if (line == "/disconnect") {
            Status status = node_.disconnect();
            if (!status) std::cout << status.message() << '\n';
        } else if (line == "/history") {
            for (const auto& m : node_.messages()) {
                std::cout << format_iso8601(m.timestamp) << "  "
                          << (m.from_current_user ? "me" : m.sender_name) << ": " << m.text << '\n';
            }
        } else {
            Status status = node_.send_message(line, [](const Status& result) {
                if (!result) std::cout << "send failed: " << result.message() << '\n';
            });
            if (!status) std::cout << "not sent: " << status.message() << '\n';
        }
        std::cout.flush();
    }

    asio::posix::stream_descriptor input_;
    asio::streambuf buffer_;
    Node& node_;
    std::function<void()> on_quit_;
};

} // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    NodeConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("beacon-node starting, config {}", config_path);

    if (!DeviceIdentity::init()) {
        spdlog::error("libsodium initialisation failed");
        return 1;
    }

    std::optional<DeviceIdentity> identity;
    try {
        identity = DeviceIdentity::load_or_create(config.identity_path, config.display_name);
    } catch (const IdentityError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    config.relay.local_id = identity->device_id();

    asio::io_context io;
    EventBus bus;
    EventLogger logger(bus);

    SimulatedTransport transport(io, bus, config.simulation);
    PeerDirectory directory(bus, config.directory);
    SocketRelay relay(io, bus, config.relay);
    Node node(bus, transport, directory, relay, std::move(*identity));

    Status status = node.start();
    if (!status) {
        spdlog::error("node failed to start: {}", status.message());
        return 1;
    }

    asio::signal_set signals(io, SIGINT, SIGTERM);
    Console console(io, node, [&]() {
        node.stop();
        console.stop();
        signals.cancel();
        io.stop();
    });
    signals.async_wait([&](const asio::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("signal {} received, shutting down", signo);
        node.stop();
        console.stop();
        io.stop();
    });

    console.start();
    spdlog::info("Backend ready. Type /peers, /connect <id>, /history or a message. Ctrl+C to exit.");

    io.run();

    bus.close();
    spdlog::info("beacon-node stopped");
    return 0;
}
