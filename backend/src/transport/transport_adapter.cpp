/**
 * TransportAdapter - contract layer over the platform radio primitive.
 */

#include "transport/transport_adapter.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace beacon {

TransportAdapter::TransportAdapter(EventBus& bus) : bus_(bus) {}

Status TransportAdapter::initialize() {
    if (initialized_) {
        return Status::success();
    }
    if (!platform_supported()) {
        spdlog::warn("transport: ad-hoc networking is not supported on this device");
        bus_.discovery.publish(events::PlatformSupport{false});
        return Status(ErrorCode::UnsupportedPlatform);
    }
    if (!platform_permissions_granted()) {
        spdlog::warn("transport: required permissions not granted");
        return Status(ErrorCode::PermissionDenied);
    }

    Status status = platform_initialize();
    if (!status) {
        spdlog::error("transport: initialisation failed: {}", status.message());
        return status;
    }

    initialized_ = true;
    spdlog::info("transport: initialised");
    bus_.discovery.publish(events::PlatformSupport{true});
    return Status::success();
}

Status TransportAdapter::start_discovery() {
    if (!initialized_) {
        return Status(ErrorCode::NotInitialized);
    }
    if (discovering_) {
        return Status::success();
    }
    if (!platform_permissions_granted()) {
        return Status(ErrorCode::PermissionDenied);
    }

    Status status = platform_start_discovery();
    if (!status) {
        spdlog::error("transport: failed to start discovery: {}", status.message());
        return status;
    }
    discovering_ = true;
    spdlog::info("transport: discovery started");
    bus_.discovery.publish(events::DiscoveryStateChanged{true});
    return Status::success();
}

Status TransportAdapter::stop_discovery() {
    if (!initialized_) {
        return Status(ErrorCode::NotInitialized);
    }
    if (!discovering_) {
        return Status::success();
    }

    Status status = platform_stop_discovery();
    // The platform stops scanning even when it reports a failure.
    discovering_ = false;
    bus_.discovery.publish(events::DiscoveryStateChanged{false});
    if (!status) {
        spdlog::warn("transport: stop discovery reported: {}", status.message());
        return status;
    }
    spdlog::info("transport: discovery stopped");
    return Status::success();
}

Status TransportAdapter::connect_to_peer(const std::string& peer_id) {
    if (!initialized_) {
        return Status(ErrorCode::NotInitialized);
    }
    auto it = std::find_if(last_snapshot_.begin(), last_snapshot_.end(),
                           [&](const DiscoveredPeer& p) { return p.id == peer_id; });
    if (it == last_snapshot_.end()) {
        return Status(ErrorCode::PeerNotFound, peer_id);
    }
    if (!platform_permissions_granted()) {
        return Status(ErrorCode::PermissionDenied);
    }

    Status status = platform_connect(*it);
    if (!status) {
        spdlog::warn("transport: join request to {} failed: {}", peer_id, status.message());
        if (status.code() != ErrorCode::ConnectFailed && status.code() != ErrorCode::PermissionDenied) {
            return Status(ErrorCode::ConnectFailed, status.message());
        }
        return status;
    }

    requested_peer_ = peer_id;
    spdlog::info("transport: join requested with {} ({})", peer_id, it->name);
    return Status::success();
}

Status TransportAdapter::disconnect() {
    if (!initialized_) {
        return Status(ErrorCode::NotInitialized);
    }
    Status status = platform_disconnect();
    if (!status) {
        spdlog::warn("transport: disconnect failed: {}", status.message());
        return status;
    }
    spdlog::info("transport: topology teardown requested");
    return Status::success();
}

void TransportAdapter::report_peers(std::vector<DiscoveredPeer> peers) {
    last_snapshot_ = peers;
    bus_.discovery.publish(events::DiscoverySnapshot{std::move(peers)});
}

void TransportAdapter::report_topology(events::TopologyChanged change) {
    if (change.connected) {
        if (topology_connected_) {
            spdlog::debug("transport: topology replaced, passing through disconnected");
            events::TopologyChanged lost;
            lost.peer_id = connected_peer_;
            bus_.topology.publish(std::move(lost));
        }
        // Joined peer, else the outstanding join request, else the group address.
        if (!change.peer_id) {
            change.peer_id = requested_peer_ ? requested_peer_ : change.coordinator_address;
        }
        topology_connected_ = true;
        connected_peer_ = change.peer_id;
        requested_peer_.reset();
    } else {
        if (!topology_connected_) {
            spdlog::debug("transport: ignoring disconnect, no active topology");
            return;
        }
        topology_connected_ = false;
        // The lost topology belongs to the peer it was formed with, not to a
        // join request issued since.
        if (!change.peer_id) {
            change.peer_id = connected_peer_;
        }
        connected_peer_.reset();
    }
    bus_.topology.publish(std::move(change));
}

} // namespace beacon
