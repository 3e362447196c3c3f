#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/event_bus.h"
#include "directory/peer.h"
#include "network/relay_state.h"
#include "protocol/chat_message.h"

namespace beacon {

/// One device record as reported by the radio layer.
struct DiscoveredPeer {
    std::string id;            // platform device address
    std::string name;
    std::string status;        // platform status string, see peer_status_from_platform
    std::string device_type;
};

namespace events {

// ---------------------------------------------------------------------------
// Discovery (Transport Adapter)
// ---------------------------------------------------------------------------

/// Full replacement of the currently visible peers. Not incremental.
struct DiscoverySnapshot {
    std::vector<DiscoveredPeer> peers;
};

struct DiscoveryStateChanged {
    bool discovering = false;
};

struct PlatformSupport {
    bool supported = false;
};

using DiscoveryEvent = std::variant<DiscoverySnapshot, DiscoveryStateChanged, PlatformSupport>;

// ---------------------------------------------------------------------------
// Topology (Transport Adapter)
// ---------------------------------------------------------------------------

struct TopologyChanged {
    bool connected = false;
    bool is_coordinator = false;
    std::optional<std::string> coordinator_address;
    /// Radio-level peer this device joined, when the platform reports it.
    std::optional<std::string> peer_id;
};

// ---------------------------------------------------------------------------
// Directory (Peer Directory)
// ---------------------------------------------------------------------------

struct PeerJoined {
    Peer peer;
};

struct PeerLeft {
    Peer peer;
};

struct PeersUpdated {
    std::vector<Peer> peers;
};

using DirectoryEvent = std::variant<PeerJoined, PeerLeft, PeersUpdated>;

// ---------------------------------------------------------------------------
// Socket (Socket Relay)
// ---------------------------------------------------------------------------

struct SocketConnected {
    RelayRole role = RelayRole::None;
    std::string remote_address;
};

struct SocketDisconnected {
    std::string reason;
};

/// Terminal failure after the bounded connect (or bind) retries.
struct SocketConnectFailed {
    std::string address;
    std::string reason;
};

struct RelayStateChanged {
    RelayState state = RelayState::Idle;
};

using SocketEvent = std::variant<SocketConnected, SocketDisconnected, SocketConnectFailed, RelayStateChanged>;

// ---------------------------------------------------------------------------
// Message (Socket Relay inbound, Node outbound)
// ---------------------------------------------------------------------------

struct MessageReceived {
    ChatMessage message;
    std::string remote_address;
    bool plain_text = false;
};

struct MessageSent {
    ChatMessage message;
};

using MessageEvent = std::variant<MessageReceived, MessageSent>;

/// Notification kind for collaborators: "peer_joined", "peer_left",
/// "message", or empty for events they do not alert on.
const char* notification_kind(const DirectoryEvent& event);
const char* notification_kind(const MessageEvent& event);

/// One-line description for logs.
std::string describe(const DiscoveryEvent& event);
std::string describe(const TopologyChanged& event);
std::string describe(const DirectoryEvent& event);
std::string describe(const SocketEvent& event);
std::string describe(const MessageEvent& event);

} // namespace events

/**
 * One broadcast channel per producer. Components receive the bus by reference
 * and subscribe to the channels they consume.
 */
struct EventBus {
    Channel<events::DiscoveryEvent> discovery;
    Channel<events::TopologyChanged> topology;
    Channel<events::DirectoryEvent> directory;
    Channel<events::SocketEvent> socket;
    Channel<events::MessageEvent> message;

    /// Call once all producers have stopped.
    void close() {
        discovery.close();
        topology.close();
        directory.close();
        socket.close();
        message.close();
    }
};

} // namespace beacon
