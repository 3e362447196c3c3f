#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/events.h"
#include "core/status.h"
#include "directory/peer_directory.h"
#include "identity/device_identity.h"
#include "network/socket_relay.h"
#include "protocol/chat_message.h"
#include "transport/transport_adapter.h"

namespace beacon {

/**
 * Represents the local Beacon node.
 *
 * Owns the identity and the append-only message log, and coordinates the
 * transport adapter, peer directory and socket relay it is handed. All
 * collaborators are constructed by the caller and must outlive the node.
 */
class Node {
public:
    using SendCallback = std::function<void(const Status& status)>;

    Node(EventBus& bus,
         TransportAdapter& transport,
         PeerDirectory& directory,
         SocketRelay& relay,
         DeviceIdentity identity);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Check platform support, initialise the transport and start discovery.
    Status start();

    /// Stop discovery and close the stream. Safe to call repeatedly.
    void stop();

    Status connect_to_peer(const std::string& peer_id);
    Status disconnect();

    /**
     * Wrap `text` in an envelope from this device and send it.
     *
     * NotConnected is returned immediately when no stream is open. Otherwise
     * `on_complete` reports the write; on success the message is appended to
     * the log and published as MessageSent.
     */
    Status send_message(const std::string& text, SendCallback on_complete = {});

    /// Copy of the message log, oldest first.
    [[nodiscard]] std::vector<ChatMessage> messages() const { return log_; }
    [[nodiscard]] std::vector<Peer> peers() const { return directory_.snapshot(); }

    [[nodiscard]] const DeviceIdentity& identity() const { return identity_; }
    [[nodiscard]] const std::string& device_id() const { return identity_.device_id(); }
    [[nodiscard]] bool stream_open() const { return relay_.is_open(); }

private:
    void on_message(const events::MessageEvent& event);

    EventBus& bus_;
    TransportAdapter& transport_;
    PeerDirectory& directory_;
    SocketRelay& relay_;
    DeviceIdentity identity_;

    std::vector<ChatMessage> log_;
    Subscription message_sub_;
};

} // namespace beacon
