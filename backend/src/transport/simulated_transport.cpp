/**
 * SimulatedTransport - timer-driven stand-in for the Wi-Fi Direct radio.
 *
 * Lets two processes on one machine (or a test) exercise the full
 * discovery -> topology -> socket path over loopback.
 */

#include "transport/simulated_transport.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace beacon {

SimulatedTransport::SimulatedTransport(asio::io_context& io, EventBus& bus, SimulationConfig config)
    : TransportAdapter(bus),
      config_(std::move(config)),
      refresh_timer_(io),
      topology_timer_(io) {}

SimulatedTransport::~SimulatedTransport() {
    refresh_timer_.cancel();
    topology_timer_.cancel();
}

void SimulatedTransport::set_visible_peers(std::vector<DiscoveredPeer> peers) {
    config_.peers = std::move(peers);
}

void SimulatedTransport::publish_snapshot() {
    report_peers(config_.peers);
}

void SimulatedTransport::inject_topology(events::TopologyChanged change) {
    report_topology(std::move(change));
}

Status SimulatedTransport::platform_initialize() {
    if (config_.form_group_on_start) {
        topology_timer_.expires_after(config_.join_delay);
        topology_timer_.async_wait([this](const asio::error_code& ec) {
            if (ec) return;
            spdlog::info("simulated transport: group formed, this device is coordinator");
            events::TopologyChanged change;
            change.connected = true;
            change.is_coordinator = true;
            change.coordinator_address = config_.coordinator_address;
            if (!config_.group_client.empty()) {
                change.peer_id = config_.group_client;
            }
            report_topology(std::move(change));
        });
    }
    return Status::success();
}

Status SimulatedTransport::platform_start_discovery() {
    schedule_refresh(std::chrono::milliseconds(0));
    return Status::success();
}

Status SimulatedTransport::platform_stop_discovery() {
    refresh_timer_.cancel();
    return Status::success();
}

Status SimulatedTransport::platform_connect(const DiscoveredPeer& peer) {
    topology_timer_.expires_after(config_.join_delay);
    topology_timer_.async_wait([this, id = peer.id](const asio::error_code& ec) {
        if (ec) return;
        report_topology(formed_topology(id));
    });
    return Status::success();
}

Status SimulatedTransport::platform_disconnect() {
    topology_timer_.expires_after(std::chrono::milliseconds(0));
    topology_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec) return;
        events::TopologyChanged change;
        change.connected = false;
        report_topology(std::move(change));
    });
    return Status::success();
}

void SimulatedTransport::schedule_refresh(std::chrono::milliseconds delay) {
    refresh_timer_.expires_after(delay);
    refresh_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || !discovering()) return;
        // An empty scan is treated as a missed refresh, not as everyone leaving.
        if (!config_.peers.empty()) {
            publish_snapshot();
        }
        schedule_refresh(config_.snapshot_interval);
    });
}

events::TopologyChanged SimulatedTransport::formed_topology(std::optional<std::string> peer_id) const {
    events::TopologyChanged change;
    change.connected = true;
    change.is_coordinator = config_.coordinator;
    change.coordinator_address = config_.coordinator_address;
    change.peer_id = std::move(peer_id);
    return change;
}

} // namespace beacon
