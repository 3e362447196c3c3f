#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace beacon {

enum class PeerStatus {
    Available,
    Connecting,   // "Invited" at the radio level
    Connected,
    Failed,
    Unavailable,
};

const char* to_string(PeerStatus status);

/// Map a platform status string ("Available", "Invited", ...) to PeerStatus.
/// Unrecognised strings map to Unavailable.
PeerStatus peer_status_from_platform(std::string_view status);

/// Signal quality scale reported for peers.
constexpr int kSignalQualityMax = 5;
constexpr int kSignalQualityMid = 3;
constexpr int kSignalQualityMin = 1;

/// Connected -> max, Available -> mid, everything else -> min.
int estimate_signal_quality(PeerStatus status);

/// Case-insensitive keyword match ("emergency", "rescue", "medical")
/// against the peer's name and device type.
bool is_emergency_device(std::string_view name, std::string_view device_type);

/**
 * One participant device as seen by the Peer Directory.
 */
struct Peer {
    std::string id;
    std::string name;
    std::string device_type;
    PeerStatus status = PeerStatus::Unavailable;
    std::chrono::system_clock::time_point last_seen{};
    int signal_quality = kSignalQualityMin;
    bool emergency = false;
};

/// Persistence view (external store consumes this shape).
void to_json(nlohmann::json& j, const Peer& peer);

} // namespace beacon
