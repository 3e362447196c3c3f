/**
 * Node - the local Beacon participant.
 *
 * Owns the identity and message log, and coordinates between the radio
 * transport, the peer directory and the socket relay.
 */

#include "node/node.h"
#include "protocol/envelope.h"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

namespace beacon {

Node::Node(EventBus& bus,
           TransportAdapter& transport,
           PeerDirectory& directory,
           SocketRelay& relay,
           DeviceIdentity identity)
    : bus_(bus),
      transport_(transport),
      directory_(directory),
      relay_(relay),
      identity_(std::move(identity)) {
    if (relay_.config().local_id != identity_.device_id()) {
        spdlog::warn("node: relay local id '{}' differs from device id '{}'",
                     relay_.config().local_id, identity_.device_id());
    }
    message_sub_ = bus_.message.subscribe(
        [this](const events::MessageEvent& e) { on_message(e); });
}

Status Node::start() {
    if (!transport_.is_supported()) {
        spdlog::error("node: ad-hoc networking is not supported on this device");
        return Status(ErrorCode::UnsupportedPlatform);
    }

    Status status = transport_.initialize();
    if (!status) {
        spdlog::error("node: transport initialisation failed: {}", status.message());
        return status;
    }

    status = transport_.start_discovery();
    if (!status) {
        spdlog::error("node: cannot start discovery: {}", status.message());
        return status;
    }
    spdlog::info("node: {} ({}) is up", identity_.display_name(), identity_.device_id());
    return Status::success();
}

void Node::stop() {
    if (transport_.initialized()) {
        Status status = transport_.stop_discovery();
        if (!status) {
            spdlog::warn("node: stop discovery: {}", status.message());
        }
    }
    relay_.stop();
}

Status Node::connect_to_peer(const std::string& peer_id) {
    Status status = transport_.connect_to_peer(peer_id);
    if (!status) {
        spdlog::warn("node: connect to {} failed: {}", peer_id, status.message());
    }
    return status;
}

Status Node::disconnect() {
    return transport_.disconnect();
}

Status Node::send_message(const std::string& text, SendCallback on_complete) {
    ChatMessage message;
    message.text = text;
    message.sender_id = identity_.device_id();
    message.sender_name = identity_.display_name();
    message.timestamp = std::chrono::system_clock::now();
    message.from_current_user = true;

    const std::string line = envelope::serialize(message);

    Status status = relay_.send(line,
        [this, message, on_complete = std::move(on_complete)](const Status& result) {
            if (result) {
                log_.push_back(message);
                bus_.message.publish(events::MessageSent{message});
            } else {
                spdlog::error("node: message not delivered: {}", result.message());
            }
            if (on_complete) on_complete(result);
        });

    if (!status) {
        spdlog::warn("node: cannot send, {}", status.message());
    }
    return status;
}

void Node::on_message(const events::MessageEvent& event) {
    if (const auto* received = std::get_if<events::MessageReceived>(&event)) {
        log_.push_back(received->message);
    }
}

} // namespace beacon
