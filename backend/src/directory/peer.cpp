#include "directory/peer.h"
#include "protocol/timestamp.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace beacon {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::string_view, 3> kEmergencyKeywords = {"emergency", "rescue", "medical"};

} // namespace

const char* to_string(PeerStatus status) {
    switch (status) {
        case PeerStatus::Available:   return "Available";
        case PeerStatus::Connecting:  return "Connecting";
        case PeerStatus::Connected:   return "Connected";
        case PeerStatus::Failed:      return "Failed";
        case PeerStatus::Unavailable: return "Unavailable";
    }
    return "Unavailable";
}

PeerStatus peer_status_from_platform(std::string_view status) {
    if (status == "Available") return PeerStatus::Available;
    if (status == "Invited" || status == "Connecting") return PeerStatus::Connecting;
    if (status == "Connected") return PeerStatus::Connected;
    if (status == "Failed") return PeerStatus::Failed;
    return PeerStatus::Unavailable;
}

int estimate_signal_quality(PeerStatus status) {
    switch (status) {
        case PeerStatus::Connected: return kSignalQualityMax;
        case PeerStatus::Available: return kSignalQualityMid;
        default:                    return kSignalQualityMin;
    }
}

bool is_emergency_device(std::string_view name, std::string_view device_type) {
    const std::string n = to_lower(name);
    const std::string t = to_lower(device_type);
    for (auto keyword : kEmergencyKeywords) {
        if (n.find(keyword) != std::string::npos || t.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void to_json(nlohmann::json& j, const Peer& peer) {
    j = nlohmann::json{
        {"peer_id", peer.id},
        {"name", peer.name},
        {"device_type", peer.device_type},
        {"status", to_string(peer.status)},
        {"last_seen", format_iso8601(peer.last_seen)},
        {"signal_strength", peer.signal_quality},
        {"is_emergency", peer.emergency},
    };
}

} // namespace beacon
