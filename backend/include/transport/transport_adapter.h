#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/events.h"
#include "core/status.h"

namespace beacon {

/**
 * Wraps the platform's ad-hoc discovery/connection primitive.
 *
 * The base class owns the contract bookkeeping (initialisation, idempotent
 * discovery, snapshot lookup for connect requests) and publishes discovery
 * and topology events on the bus. A concrete radio stack implements the
 * protected platform_* hooks and reports what the platform tells it through
 * report_peers() / report_topology().
 */
class TransportAdapter {
public:
    explicit TransportAdapter(EventBus& bus);
    virtual ~TransportAdapter() = default;

    TransportAdapter(const TransportAdapter&) = delete;
    TransportAdapter& operator=(const TransportAdapter&) = delete;

    /// Platform capability query, no side effects.
    [[nodiscard]] bool is_supported() const { return platform_supported(); }

    /// Acquire permissions and register for platform callbacks.
    /// Fails with UnsupportedPlatform or PermissionDenied.
    Status initialize();

    /// Idempotent; NotInitialized before initialize().
    Status start_discovery();
    Status stop_discovery();

    /// Request a radio-level join. Success means "requested", the outcome
    /// arrives later as TopologyChanged. PeerNotFound if the id is not in the
    /// last discovery snapshot.
    Status connect_to_peer(const std::string& peer_id);

    /// Tear down the current topology.
    Status disconnect();

    [[nodiscard]] bool initialized() const { return initialized_; }
    [[nodiscard]] bool discovering() const { return discovering_; }
    [[nodiscard]] bool topology_connected() const { return topology_connected_; }
    [[nodiscard]] const std::optional<std::string>& connected_peer() const { return connected_peer_; }
    [[nodiscard]] const std::vector<DiscoveredPeer>& last_snapshot() const { return last_snapshot_; }

protected:
    virtual bool platform_supported() const = 0;
    virtual bool platform_permissions_granted() const = 0;
    virtual Status platform_initialize() = 0;
    virtual Status platform_start_discovery() = 0;
    virtual Status platform_stop_discovery() = 0;
    virtual Status platform_connect(const DiscoveredPeer& peer) = 0;
    virtual Status platform_disconnect() = 0;

    /// Platform delivered a full peer list.
    void report_peers(std::vector<DiscoveredPeer> peers);

    /// Platform reported a topology change. A connect while already connected
    /// is preceded by a synthesized disconnect; repeated disconnects are dropped.
    /// Events without a peer id are tagged with the joined peer.
    void report_topology(events::TopologyChanged change);

    EventBus& bus_;

private:
    bool initialized_ = false;
    bool discovering_ = false;
    bool topology_connected_ = false;
    std::vector<DiscoveredPeer> last_snapshot_;
    /// Last connect_to_peer() target, until a topology forms.
    std::optional<std::string> requested_peer_;
    /// Peer the current topology was formed with.
    std::optional<std::string> connected_peer_;
};

} // namespace beacon
