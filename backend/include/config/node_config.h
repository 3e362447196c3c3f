#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "directory/peer_directory.h"
#include "network/socket_relay.h"
#include "transport/simulated_transport.h"

namespace beacon {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Everything read from config.json. Every key is optional.
 *
 * {
 *   "node":       { "display_name": "...", "identity_path": "identity.json" },
 *   "relay":      { "port": 8888, "settle_delay_ms": 1000, "connect_attempts": 3,
 *                   "backoff_step_ms": 1000, "connect_timeout_ms": 5000 },
 *   "directory":  { "disconnect_grace_ms": 30000 },
 *   "log":        { "level": "info" },
 *   "simulation": { "coordinator": false, "coordinator_address": "127.0.0.1",
 *                   "form_group_on_start": false, "group_client": "",
 *                   "snapshot_interval_ms": 5000,
 *                   "join_delay_ms": 200, "supported": true,
 *                   "permission_granted": true,
 *                   "peers": [ { "id": "...", "name": "...", "status": "Available",
 *                                "device_type": "..." } ] }
 * }
 */
struct NodeConfig {
    std::string display_name;
    std::string identity_path = "identity.json";
    std::string log_level = "info";

    RelayConfig relay;
    DirectoryConfig directory;
    SimulationConfig simulation;
};

/// Throws ConfigError on type mismatches.
NodeConfig parse_config(const nlohmann::json& j);

/// Throws ConfigError if the file cannot be opened or is not valid JSON.
NodeConfig load_config(const std::string& path);

} // namespace beacon
