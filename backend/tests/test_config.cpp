#include <doctest/doctest.h>
#include "config/node_config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace beacon;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_CASE("Empty config yields defaults") {
    NodeConfig cfg = parse_config(json::object());
    CHECK(cfg.identity_path == "identity.json");
    CHECK(cfg.log_level == "info");
    CHECK(cfg.relay.port == 8888);
    CHECK(cfg.relay.settle_delay == 1000ms);
    CHECK(cfg.relay.connect_attempts == 3);
    CHECK(cfg.relay.backoff_step == 1000ms);
    CHECK(cfg.directory.disconnect_grace == 30000ms);
    CHECK_FALSE(cfg.simulation.coordinator);
    CHECK(cfg.simulation.peers.empty());
}

TEST_CASE("Every section is read") {
    json j = json::parse(R"({
        "node": { "display_name": "Shelter 4", "identity_path": "/tmp/id.json" },
        "log": { "level": "debug" },
        "relay": { "port": 9000, "settle_delay_ms": 250, "connect_attempts": 5,
                   "backoff_step_ms": 100, "connect_timeout_ms": 2000 },
        "directory": { "disconnect_grace_ms": 5000 },
        "simulation": { "coordinator": true, "form_group_on_start": true, "group_client": "02:aa",
                        "join_delay_ms": 50,
                        "peers": [ { "id": "aa:01", "name": "Medic" },
                                   { "id": "aa:02", "status": "Invited", "device_type": "tablet" } ] }
    })");

    NodeConfig cfg = parse_config(j);
    CHECK(cfg.display_name == "Shelter 4");
    CHECK(cfg.identity_path == "/tmp/id.json");
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.relay.port == 9000);
    CHECK(cfg.relay.settle_delay == 250ms);
    CHECK(cfg.relay.connect_attempts == 5);
    CHECK(cfg.relay.backoff_step == 100ms);
    CHECK(cfg.relay.connect_timeout == 2000ms);
    CHECK(cfg.directory.disconnect_grace == 5000ms);
    CHECK(cfg.simulation.coordinator);
    CHECK(cfg.simulation.form_group_on_start);
    CHECK(cfg.simulation.group_client == "02:aa");
    CHECK(cfg.simulation.join_delay == 50ms);
    REQUIRE(cfg.simulation.peers.size() == 2);
    CHECK(cfg.simulation.peers[0].status == "Available");
    CHECK(cfg.simulation.peers[1].status == "Invited");
    CHECK(cfg.simulation.peers[1].device_type == "tablet");
}

TEST_CASE("Invalid values are rejected with ConfigError") {
    CHECK_THROWS_AS(parse_config(json::array()), ConfigError);
    CHECK_THROWS_AS(parse_config(json{{"relay", 5}}), ConfigError);
    CHECK_THROWS_AS(parse_config(json{{"relay", {{"port", 70000}}}}), ConfigError);
    CHECK_THROWS_AS(parse_config(json{{"relay", {{"connect_attempts", 0}}}}), ConfigError);
    CHECK_THROWS_AS(parse_config(json{{"relay", {{"settle_delay_ms", -1}}}}), ConfigError);
    CHECK_THROWS_AS(parse_config(json{{"relay", {{"port", "eighty"}}}}), ConfigError);
    CHECK_THROWS_AS(parse_config(json::parse(R"({"simulation":{"peers":[{"name":"no id"}]}})")), ConfigError);
    CHECK_THROWS_AS(parse_config(json::parse(R"({"simulation":{"peers":{"id":"aa"}}})")), ConfigError);
}

TEST_CASE("load_config reports unreadable and malformed files") {
    namespace fs = std::filesystem;
    CHECK_THROWS_AS(load_config("/nonexistent/beacon/config.json"), ConfigError);

    const fs::path path = fs::temp_directory_path() / "beacon_test_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_THROWS_AS(load_config(path.string()), ConfigError);

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"relay":{"port":1234}})";
    }
    CHECK(load_config(path.string()).relay.port == 1234);
    fs::remove(path);
}
