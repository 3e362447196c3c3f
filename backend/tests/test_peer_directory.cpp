#include <doctest/doctest.h>
#include "directory/peer_directory.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace beacon;
using namespace std::chrono;

namespace {

DiscoveredPeer discovered(std::string id, std::string name, std::string status = "Available",
                          std::string type = "phone") {
    return DiscoveredPeer{std::move(id), std::move(name), std::move(status), std::move(type)};
}

struct Fixture {
    EventBus bus;
    system_clock::time_point now = system_clock::time_point(seconds(1'700'000'000));
    PeerDirectory directory{bus, DirectoryConfig{milliseconds(30000)}, [this] { return now; }};

    std::vector<std::string> joined;
    std::vector<std::string> left;
    int updates = 0;
    Subscription sub = bus.directory.subscribe([this](const events::DirectoryEvent& e) {
        if (auto* j = std::get_if<events::PeerJoined>(&e)) joined.push_back(j->peer.id);
        if (auto* l = std::get_if<events::PeerLeft>(&e)) left.push_back(l->peer.id);
        if (std::holds_alternative<events::PeersUpdated>(e)) ++updates;
    });

    void snapshot(std::vector<DiscoveredPeer> peers) {
        bus.discovery.publish(events::DiscoverySnapshot{std::move(peers)});
    }

    void topology(bool connected, std::optional<std::string> peer_id) {
        events::TopologyChanged change;
        change.connected = connected;
        change.peer_id = std::move(peer_id);
        bus.topology.publish(change);
    }
};

} // namespace

TEST_CASE("Discovered peers get status, signal quality and emergency flag") {
    Fixture f;
    f.snapshot({discovered("a", "Volunteer Phone"),
                discovered("b", "Rescue Team 2", "Invited"),
                discovered("c", "", "Lost", "Medical Tablet")});

    REQUIRE(f.directory.size() == 3);
    auto a = *f.directory.find("a");
    CHECK(a.status == PeerStatus::Available);
    CHECK(a.signal_quality == kSignalQualityMid);
    CHECK_FALSE(a.emergency);
    CHECK(a.last_seen == f.now);

    auto b = *f.directory.find("b");
    CHECK(b.status == PeerStatus::Connecting);
    CHECK(b.signal_quality == kSignalQualityMin);
    CHECK(b.emergency);

    auto c = *f.directory.find("c");
    CHECK(c.name == "Unknown Device");
    CHECK(c.status == PeerStatus::Unavailable);
    CHECK(c.emergency);

    CHECK(f.joined == std::vector<std::string>{"a", "b", "c"});
    CHECK(f.updates == 1);
}

TEST_CASE("Connected peer survives a snapshot that omits it") {
    Fixture f;
    f.snapshot({discovered("a", "Alpha"), discovered("b", "Bravo")});
    f.topology(true, std::string("a"));

    f.now += seconds(5);
    f.snapshot({discovered("b", "Bravo")});

    auto a = f.directory.find("a");
    REQUIRE(a.has_value());
    CHECK(a->status == PeerStatus::Connected);
    CHECK(a->signal_quality == kSignalQualityMax);
    CHECK(a->last_seen == f.now);
    CHECK(f.left.empty());
}

TEST_CASE("Connected peer listed as Available in a snapshot stays Connected") {
    Fixture f;
    f.snapshot({discovered("a", "Alpha")});
    f.topology(true, std::string("a"));
    f.snapshot({discovered("a", "Alpha renamed", "Available")});

    auto a = *f.directory.find("a");
    CHECK(a.status == PeerStatus::Connected);
    CHECK(a.name == "Alpha renamed");
}

TEST_CASE("Unlisted non-connected peers are dropped") {
    Fixture f;
    f.snapshot({discovered("a", "Alpha"), discovered("b", "Bravo")});
    f.snapshot({discovered("b", "Bravo")});

    CHECK_FALSE(f.directory.find("a").has_value());
    CHECK(f.left == std::vector<std::string>{"a"});
}

TEST_CASE("Connection before discovery synthesizes a peer entry") {
    Fixture f;
    f.topology(true, std::string("zz"));

    auto p = f.directory.find("zz");
    REQUIRE(p.has_value());
    CHECK(p->name == "Connected Device");
    CHECK(p->status == PeerStatus::Connected);
    CHECK_FALSE(p->emergency);
    CHECK(f.directory.connected_peer() == std::optional<std::string>("zz"));
    CHECK(f.joined == std::vector<std::string>{"zz"});
}

TEST_CASE("Disconnect demotes to Available and the peer leaves after the grace period") {
    Fixture f;
    f.snapshot({discovered("a", "Alpha")});
    f.topology(true, std::string("a"));
    f.topology(false, std::string("a"));

    auto a = *f.directory.find("a");
    CHECK(a.status == PeerStatus::Available);
    CHECK(a.signal_quality == kSignalQualityMid);
    CHECK_FALSE(f.directory.connected_peer().has_value());

    f.now += seconds(10);
    f.snapshot({});
    CHECK(f.directory.find("a").has_value());

    f.now += seconds(25);
    f.snapshot({});
    CHECK_FALSE(f.directory.find("a").has_value());
    CHECK(f.left == std::vector<std::string>{"a"});
}

TEST_CASE("Disconnect without an id demotes every Connected peer") {
    Fixture f;
    f.topology(true, std::string("a"));
    f.topology(false, std::nullopt);
    CHECK(f.directory.find("a")->status == PeerStatus::Available);
}

TEST_CASE("Surviving peers keep their position and duplicates are ignored") {
    Fixture f;
    f.snapshot({discovered("a", "Alpha"), discovered("b", "Bravo")});
    f.snapshot({discovered("c", "Charlie"), discovered("b", "Bravo"), discovered("a", "Alpha"),
                discovered("a", "Alpha duplicate")});

    auto peers = f.directory.snapshot();
    REQUIRE(peers.size() == 3);
    CHECK(peers[0].id == "a");
    CHECK(peers[0].name == "Alpha");
    CHECK(peers[1].id == "b");
    CHECK(peers[2].id == "c");
}

TEST_CASE("Peer persistence view") {
    Peer p;
    p.id = "02:11:22:33:44:55";
    p.name = "Field Medical Kit";
    p.device_type = "phone";
    p.status = PeerStatus::Connected;
    p.last_seen = system_clock::time_point(seconds(1'709'280'930));
    p.signal_quality = kSignalQualityMax;
    p.emergency = true;

    nlohmann::json j = p;
    CHECK(j["peer_id"] == "02:11:22:33:44:55");
    CHECK(j["status"] == "Connected");
    CHECK(j["last_seen"] == "2024-03-01T08:15:30.000Z");
    CHECK(j["signal_strength"] == 5);
    CHECK(j["is_emergency"] == true);
}

TEST_CASE("Platform status mapping") {
    CHECK(peer_status_from_platform("Available") == PeerStatus::Available);
    CHECK(peer_status_from_platform("Invited") == PeerStatus::Connecting);
    CHECK(peer_status_from_platform("Connected") == PeerStatus::Connected);
    CHECK(peer_status_from_platform("Failed") == PeerStatus::Failed);
    CHECK(peer_status_from_platform("Unavailable") == PeerStatus::Unavailable);
    CHECK(peer_status_from_platform("garbage") == PeerStatus::Unavailable);
}

TEST_CASE("Emergency keywords are case-insensitive") {
    CHECK(is_emergency_device("EMERGENCY beacon", ""));
    CHECK(is_emergency_device("Phone", "rescue-radio"));
    CHECK_FALSE(is_emergency_device("Phone", "tablet"));
}
