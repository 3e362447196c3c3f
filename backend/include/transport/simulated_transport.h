#pragma once

#include <asio.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "transport/transport_adapter.h"

namespace beacon {

/// Behaviour of the in-process radio stand-in.
struct SimulationConfig {
    bool supported = true;
    bool permission_granted = true;

    /// Role this device takes when a topology forms.
    bool coordinator = false;
    /// Group owner address reported with every formed topology. Clients
    /// connect to it; a coordinator reports its own address.
    std::string coordinator_address = "127.0.0.1";

    /// Form a topology as coordinator right after initialize(), as a group
    /// owner would when a remote device joins it.
    bool form_group_on_start = false;
    /// Device id reported as the joined client of that group, if known.
    std::string group_client;

    std::chrono::milliseconds snapshot_interval{5000};
    std::chrono::milliseconds join_delay{200};

    std::vector<DiscoveredPeer> peers;
};

/**
 * Transport adapter backed by configuration instead of a radio.
 *
 * Publishes the configured peer list when discovery starts and on every
 * refresh interval, skipping empty scans. Forms and tears down topologies on
 * a timer after connect_to_peer() / disconnect(). Tests drive it through the
 * set_visible_peers() / publish_snapshot() / inject_topology() hooks.
 */
class SimulatedTransport : public TransportAdapter {
public:
    SimulatedTransport(asio::io_context& io, EventBus& bus, SimulationConfig config);
    ~SimulatedTransport() override;

    void set_visible_peers(std::vector<DiscoveredPeer> peers);
    void set_permission_granted(bool granted) { config_.permission_granted = granted; }

    /// Publish the current peer list now, even when it is empty.
    void publish_snapshot();

    /// Deliver a topology change as if the radio layer reported it.
    void inject_topology(events::TopologyChanged change);

    [[nodiscard]] const SimulationConfig& config() const { return config_; }

protected:
    bool platform_supported() const override { return config_.supported; }
    bool platform_permissions_granted() const override { return config_.permission_granted; }
    Status platform_initialize() override;
    Status platform_start_discovery() override;
    Status platform_stop_discovery() override;
    Status platform_connect(const DiscoveredPeer& peer) override;
    Status platform_disconnect() override;

private:
    void schedule_refresh(std::chrono::milliseconds delay);
    events::TopologyChanged formed_topology(std::optional<std::string> peer_id) const;

    SimulationConfig config_;
    asio::steady_timer refresh_timer_;
    asio::steady_timer topology_timer_;
};

} // namespace beacon
