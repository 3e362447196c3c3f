#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/events.h"
#include "directory/peer.h"

namespace beacon {

struct DirectoryConfig {
    /// How long a peer demoted by a disconnect survives discovery refreshes
    /// that no longer list it.
    std::chrono::milliseconds disconnect_grace{30000};
};

/// Name given to a peer first seen through a connection event.
inline constexpr const char* kSynthesizedPeerName = "Connected Device";

/// Name given to a discovered peer that reports an empty name.
inline constexpr const char* kUnnamedPeer = "Unknown Device";

/**
 * Merge a discovery snapshot into the current peer list.
 *
 * - Listed peers take the snapshot's name/status, except that an id in
 *   `connected` stays Connected.
 * - Unlisted peers that are Connected are kept, with last_seen refreshed.
 * - Unlisted peers released (disconnected) less than `grace` ago are kept
 *   unchanged; all other unlisted peers are dropped.
 *
 * Surviving peers keep their position; new peers are appended in snapshot
 * order. Duplicate ids in the snapshot are ignored after the first.
 */
std::vector<Peer> reconcile_discovery(
    const std::vector<Peer>& current,
    const std::vector<DiscoveredPeer>& discovered,
    const std::vector<std::string>& connected,
    const std::map<std::string, std::chrono::system_clock::time_point>& released,
    std::chrono::milliseconds grace,
    std::chrono::system_clock::time_point now);

/**
 * Authoritative view of known peers.
 *
 * Consumes DiscoverySnapshot and TopologyChanged from the bus, owns the peer
 * set, and publishes PeerJoined / PeerLeft / PeersUpdated on the directory
 * channel. Other components only read snapshots.
 */
class PeerDirectory {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit PeerDirectory(EventBus& bus,
                           DirectoryConfig config = {},
                           Clock clock = &std::chrono::system_clock::now);

    PeerDirectory(const PeerDirectory&) = delete;
    PeerDirectory& operator=(const PeerDirectory&) = delete;

    /// Replace the discovered set, keeping Connected peers (see reconcile_discovery).
    void apply_discovery_snapshot(const std::vector<DiscoveredPeer>& peers);

    /// Mark a peer Connected (synthesizing it if unknown) or demote it to
    /// Available on disconnect. A disconnect without an id demotes every
    /// Connected peer.
    void apply_connection_change(bool connected, const std::optional<std::string>& peer_id);

    [[nodiscard]] std::vector<Peer> snapshot() const { return peers_; }
    [[nodiscard]] std::optional<Peer> find(const std::string& id) const;
    [[nodiscard]] const std::optional<std::string>& connected_peer() const { return connected_id_; }
    [[nodiscard]] std::size_t size() const { return peers_.size(); }

private:
    void on_discovery(const events::DiscoveryEvent& event);
    void on_topology(const events::TopologyChanged& event);
    void commit(std::vector<Peer> next);

    EventBus& bus_;
    DirectoryConfig config_;
    Clock clock_;

    std::vector<Peer> peers_;
    std::optional<std::string> connected_id_;
    std::map<std::string, std::chrono::system_clock::time_point> released_;

    Subscription discovery_sub_;
    Subscription topology_sub_;
};

} // namespace beacon
