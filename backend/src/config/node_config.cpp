/**
 * NodeConfig - JSON configuration with defaults for every key.
 */

#include "config/node_config.h"

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace beacon {

namespace {

const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("config section '") + name + "' must be an object");
    }
    return *it;
}

std::chrono::milliseconds millis(const json& s, const char* key, std::chrono::milliseconds fallback) {
    const auto value = s.value(key, static_cast<long long>(fallback.count()));
    if (value < 0) {
        throw ConfigError(std::string("'") + key + "' must not be negative");
    }
    return std::chrono::milliseconds(value);
}

DiscoveredPeer parse_peer(const json& p) {
    if (!p.is_object()) {
        throw ConfigError("simulation peers must be objects");
    }
    DiscoveredPeer peer;
    peer.id = p.value("id", std::string());
    peer.name = p.value("name", std::string());
    peer.status = p.value("status", std::string("Available"));
    peer.device_type = p.value("device_type", std::string());
    if (peer.id.empty()) {
        throw ConfigError("simulation peer without an id");
    }
    return peer;
}

} // namespace

NodeConfig parse_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    NodeConfig cfg;
    try {
        const json& node = section(j, "node");
        cfg.display_name = node.value("display_name", cfg.display_name);
        cfg.identity_path = node.value("identity_path", cfg.identity_path);

        cfg.log_level = section(j, "log").value("level", cfg.log_level);

        const json& relay = section(j, "relay");
        const auto port = relay.value("port", static_cast<int>(cfg.relay.port));
        if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("relay.port out of range");
        }
        cfg.relay.port = static_cast<uint16_t>(port);
        cfg.relay.settle_delay = millis(relay, "settle_delay_ms", cfg.relay.settle_delay);
        cfg.relay.connect_attempts = relay.value("connect_attempts", cfg.relay.connect_attempts);
        if (cfg.relay.connect_attempts < 1) {
            throw ConfigError("relay.connect_attempts must be at least 1");
        }
        cfg.relay.backoff_step = millis(relay, "backoff_step_ms", cfg.relay.backoff_step);
        cfg.relay.connect_timeout = millis(relay, "connect_timeout_ms", cfg.relay.connect_timeout);

        const json& directory = section(j, "directory");
        cfg.directory.disconnect_grace =
            millis(directory, "disconnect_grace_ms", cfg.directory.disconnect_grace);

        const json& sim = section(j, "simulation");
        cfg.simulation.supported = sim.value("supported", cfg.simulation.supported);
        cfg.simulation.permission_granted = sim.value("permission_granted", cfg.simulation.permission_granted);
        cfg.simulation.coordinator = sim.value("coordinator", cfg.simulation.coordinator);
        cfg.simulation.coordinator_address = sim.value("coordinator_address", cfg.simulation.coordinator_address);
        cfg.simulation.form_group_on_start = sim.value("form_group_on_start", cfg.simulation.form_group_on_start);
        cfg.simulation.group_client = sim.value("group_client", cfg.simulation.group_client);
        cfg.simulation.snapshot_interval = millis(sim, "snapshot_interval_ms", cfg.simulation.snapshot_interval);
        cfg.simulation.join_delay = millis(sim, "join_delay_ms", cfg.simulation.join_delay);

        auto peers = sim.find("peers");
        if (peers != sim.end()) {
            if (!peers->is_array()) {
                throw ConfigError("simulation.peers must be an array");
            }
            for (const auto& p : *peers) {
                cfg.simulation.peers.push_back(parse_peer(p));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }
    return cfg;
}

NodeConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    json j = json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw ConfigError("config file is not valid JSON: " + path);
    }
    return parse_config(j);
}

} // namespace beacon
