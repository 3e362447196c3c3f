/**
 * PeerDirectory - reconciles radio discovery snapshots with connection state.
 *
 * Discovery snapshots are full replacements and the radio layer sometimes
 * omits the peer we are talking to. Connected peers are therefore never
 * dropped by a refresh; they only fall back to Available on disconnect and
 * leave after the disconnect grace period.
 */

#include "directory/peer_directory.h"

#include <algorithm>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace beacon {

using SysClock = std::chrono::system_clock;

namespace {

Peer peer_from_discovery(const DiscoveredPeer& d, SysClock::time_point now) {
    Peer p;
    p.id = d.id;
    p.name = d.name.empty() ? kUnnamedPeer : d.name;
    p.device_type = d.device_type;
    p.status = peer_status_from_platform(d.status);
    p.last_seen = now;
    p.signal_quality = estimate_signal_quality(p.status);
    p.emergency = is_emergency_device(p.name, p.device_type);
    return p;
}

void mark_connected(Peer& p, SysClock::time_point now) {
    p.status = PeerStatus::Connected;
    p.last_seen = now;
    p.signal_quality = estimate_signal_quality(PeerStatus::Connected);
}

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

std::vector<Peer> reconcile_discovery(
    const std::vector<Peer>& current,
    const std::vector<DiscoveredPeer>& discovered,
    const std::vector<std::string>& connected,
    const std::map<std::string, SysClock::time_point>& released,
    std::chrono::milliseconds grace,
    SysClock::time_point now) {

    // First occurrence of each id wins.
    std::map<std::string, const DiscoveredPeer*> listed;
    std::vector<const DiscoveredPeer*> listed_order;
    for (const auto& d : discovered) {
        if (d.id.empty()) continue;
        if (listed.emplace(d.id, &d).second) {
            listed_order.push_back(&d);
        }
    }

    std::vector<Peer> next;
    next.reserve(current.size() + listed_order.size());
    std::set<std::string> placed;

    for (const auto& existing : current) {
        auto it = listed.find(existing.id);
        if (it != listed.end()) {
            Peer updated = peer_from_discovery(*it->second, now);
            if (contains(connected, existing.id)) {
                mark_connected(updated, now);
            }
            next.push_back(std::move(updated));
            placed.insert(existing.id);
            continue;
        }

        if (existing.status == PeerStatus::Connected) {
            Peer kept = existing;
            mark_connected(kept, now);
            next.push_back(std::move(kept));
            placed.insert(existing.id);
            continue;
        }

        auto rel = released.find(existing.id);
        if (rel != released.end() && now - rel->second < grace) {
            next.push_back(existing);
            placed.insert(existing.id);
        }
    }

    for (const DiscoveredPeer* d : listed_order) {
        if (placed.count(d->id) != 0) continue;
        Peer added = peer_from_discovery(*d, now);
        if (contains(connected, d->id)) {
            mark_connected(added, now);
        }
        next.push_back(std::move(added));
    }

    return next;
}

PeerDirectory::PeerDirectory(EventBus& bus, DirectoryConfig config, Clock clock)
    : bus_(bus), config_(config), clock_(std::move(clock)) {
    discovery_sub_ = bus_.discovery.subscribe(
        [this](const events::DiscoveryEvent& e) { on_discovery(e); });
    topology_sub_ = bus_.topology.subscribe(
        [this](const events::TopologyChanged& e) { on_topology(e); });
}

void PeerDirectory::on_discovery(const events::DiscoveryEvent& event) {
    if (const auto* snap = std::get_if<events::DiscoverySnapshot>(&event)) {
        apply_discovery_snapshot(snap->peers);
    }
}

void PeerDirectory::on_topology(const events::TopologyChanged& event) {
    apply_connection_change(event.connected, event.peer_id);
}

void PeerDirectory::apply_discovery_snapshot(const std::vector<DiscoveredPeer>& peers) {
    const auto now = clock_();

    std::vector<std::string> connected;
    if (connected_id_) {
        connected.push_back(*connected_id_);
    }

    auto next = reconcile_discovery(peers_, peers, connected, released_,
                                    config_.disconnect_grace, now);

    // Forget released entries that did not survive.
    for (auto it = released_.begin(); it != released_.end();) {
        bool kept = std::any_of(next.begin(), next.end(),
                                [&](const Peer& p) { return p.id == it->first; });
        it = kept ? std::next(it) : released_.erase(it);
    }

    spdlog::debug("directory: snapshot of {} peer(s) -> {} known", peers.size(), next.size());
    commit(std::move(next));
}

void PeerDirectory::apply_connection_change(bool connected,
                                            const std::optional<std::string>& peer_id) {
    const auto now = clock_();
    std::vector<Peer> next = peers_;

    if (connected) {
        if (!peer_id || peer_id->empty()) {
            spdlog::debug("directory: connection without peer id, nothing to mark");
            return;
        }
        auto it = std::find_if(next.begin(), next.end(),
                               [&](const Peer& p) { return p.id == *peer_id; });
        if (it != next.end()) {
            mark_connected(*it, now);
        } else {
            Peer synthesized;
            synthesized.id = *peer_id;
            synthesized.name = kSynthesizedPeerName;
            synthesized.emergency = false;
            mark_connected(synthesized, now);
            next.push_back(std::move(synthesized));
            spdlog::info("directory: synthesized entry for connected peer {}", *peer_id);
        }
        connected_id_ = *peer_id;
        released_.erase(*peer_id);
        commit(std::move(next));
        return;
    }

    const bool targeted = peer_id && !peer_id->empty();
    bool changed = false;
    for (auto& p : next) {
        if (p.status != PeerStatus::Connected) continue;
        if (targeted && p.id != *peer_id) continue;
        p.status = PeerStatus::Available;
        p.last_seen = now;
        p.signal_quality = estimate_signal_quality(PeerStatus::Available);
        released_[p.id] = now;
        changed = true;
    }
    if (!targeted || (connected_id_ && *connected_id_ == *peer_id)) {
        connected_id_.reset();
    }
    if (changed) {
        commit(std::move(next));
    }
}

std::optional<Peer> PeerDirectory::find(const std::string& id) const {
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&](const Peer& p) { return p.id == id; });
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return *it;
}

void PeerDirectory::commit(std::vector<Peer> next) {
    std::vector<Peer> previous = std::move(peers_);
    peers_ = std::move(next);

    auto has = [](const std::vector<Peer>& list, const std::string& id) {
        return std::any_of(list.begin(), list.end(), [&](const Peer& p) { return p.id == id; });
    };

    for (const auto& p : previous) {
        if (!has(peers_, p.id)) {
            spdlog::info("directory: peer left {} ({})", p.id, p.name);
            bus_.directory.publish(events::PeerLeft{p});
        }
    }
    for (const auto& p : peers_) {
        if (!has(previous, p.id)) {
            spdlog::info("directory: peer joined {} ({})", p.id, p.name);
            bus_.directory.publish(events::PeerJoined{p});
        }
    }
    bus_.directory.publish(events::PeersUpdated{peers_});
}

} // namespace beacon
