#include "core/events.h"

#include <sstream>
#include <type_traits>

namespace beacon {

const char* to_string(RelayState state) {
    switch (state) {
        case RelayState::Idle:       return "Idle";
        case RelayState::Listening:  return "Listening";
        case RelayState::Connecting: return "Connecting";
        case RelayState::Open:       return "Open";
        case RelayState::Closing:    return "Closing";
    }
    return "Idle";
}

const char* to_string(RelayRole role) {
    switch (role) {
        case RelayRole::None:      return "none";
        case RelayRole::Listener:  return "listener";
        case RelayRole::Connector: return "connector";
    }
    return "none";
}

namespace events {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string preview(const std::string& text) {
    constexpr std::size_t kMax = 30;
    return text.size() > kMax ? text.substr(0, kMax) + "..." : text;
}

} // namespace

const char* notification_kind(const DirectoryEvent& event) {
    return std::visit(overloaded{
        [](const PeerJoined&) { return "peer_joined"; },
        [](const PeerLeft&) { return "peer_left"; },
        [](const PeersUpdated&) { return ""; },
    }, event);
}

const char* notification_kind(const MessageEvent& event) {
    return std::visit(overloaded{
        [](const MessageReceived&) { return "message"; },
        [](const MessageSent&) { return ""; },
    }, event);
}

std::string describe(const DiscoveryEvent& event) {
    return std::visit(overloaded{
        [](const DiscoverySnapshot& e) {
            return "discovery snapshot: " + std::to_string(e.peers.size()) + " peer(s)";
        },
        [](const DiscoveryStateChanged& e) {
            return std::string(e.discovering ? "discovery started" : "discovery stopped");
        },
        [](const PlatformSupport& e) {
            return std::string(e.supported ? "platform supported" : "platform unsupported");
        },
    }, event);
}

std::string describe(const TopologyChanged& event) {
    std::ostringstream os;
    if (!event.connected) {
        os << "topology disconnected";
        return os.str();
    }
    os << "topology connected, coordinator=" << (event.is_coordinator ? "self" : "remote");
    if (event.coordinator_address) os << " address=" << *event.coordinator_address;
    if (event.peer_id) os << " peer=" << *event.peer_id;
    return os.str();
}

std::string describe(const DirectoryEvent& event) {
    return std::visit(overloaded{
        [](const PeerJoined& e) { return "peer joined: " + e.peer.id + " (" + e.peer.name + ")"; },
        [](const PeerLeft& e) { return "peer left: " + e.peer.id + " (" + e.peer.name + ")"; },
        [](const PeersUpdated& e) { return "peers updated: " + std::to_string(e.peers.size()); },
    }, event);
}

std::string describe(const SocketEvent& event) {
    return std::visit(overloaded{
        [](const SocketConnected& e) {
            return std::string("socket connected as ") + to_string(e.role) + " with " + e.remote_address;
        },
        [](const SocketDisconnected& e) { return "socket disconnected: " + e.reason; },
        [](const SocketConnectFailed& e) {
            return "socket connect failed to " + e.address + ": " + e.reason;
        },
        [](const RelayStateChanged& e) { return std::string("relay state -> ") + to_string(e.state); },
    }, event);
}

std::string describe(const MessageEvent& event) {
    return std::visit(overloaded{
        [](const MessageReceived& e) {
            return "message from " + e.message.sender_name + " [" + e.message.sender_id + "]" +
                   (e.plain_text ? " (plain)" : "") + ": " + preview(e.message.text);
        },
        [](const MessageSent& e) { return "message sent: " + preview(e.message.text); },
    }, event);
}

} // namespace events
} // namespace beacon
