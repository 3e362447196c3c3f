#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/events.h"
#include "core/status.h"
#include "network/line_session.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "network/relay_state.h"

namespace beacon {

struct RelayConfig {
    /// This device's identifier, used to flag inbound messages as our own.
    std::string local_id;

    /// Well-known port of the coordinator's listening endpoint.
    uint16_t port = 8888;

    /// Pause after a topology forms before binding or connecting.
    std::chrono::milliseconds settle_delay{1000};

    /// Connect attempts before giving up; attempt n waits n * backoff_step.
    int connect_attempts = 3;
    std::chrono::milliseconds backoff_step{1000};

    /// Per-attempt bound on resolve + connect.
    std::chrono::milliseconds connect_timeout{5000};
};

/**
 * Owns the single application-level byte stream of this device.
 *
 * Reacts to TopologyChanged on the bus: the coordinator listens, everyone
 * else connects to the coordinator with bounded retry. Inbound lines are
 * decoded by the envelope protocol and published as MessageReceived.
 * Losing the topology (or stop()) closes everything unconditionally and
 * publishes SocketDisconnected once.
 *
 * Only one stream is serviced for writing. Extra inbound connections on the
 * coordinator are read but never written to.
 */
class SocketRelay {
public:
    using SendCallback = std::function<void(const Status& status)>;

    SocketRelay(asio::io_context& io, EventBus& bus, RelayConfig config);
    ~SocketRelay();

    SocketRelay(const SocketRelay&) = delete;
    SocketRelay& operator=(const SocketRelay&) = delete;

    /// React to a radio-level topology change (normally delivered by the bus).
    void handle_topology(const events::TopologyChanged& change);

    /**
     * Write one line to the open stream.
     *
     * Returns NotConnected immediately unless Open. Otherwise the write is
     * queued and `on_complete` later receives success or SendFailed(reason).
     * A failed send does not tear the stream down.
     */
    Status send(const std::string& line, SendCallback on_complete = {});

    /// Close everything and return to Idle.
    void stop();

    [[nodiscard]] RelayState state() const { return state_; }
    [[nodiscard]] RelayRole role() const { return role_; }
    [[nodiscard]] bool is_open() const { return state_ == RelayState::Open; }
    [[nodiscard]] const std::string& remote_address() const { return remote_address_; }
    [[nodiscard]] uint16_t listening_port() const { return server_.port(); }
    [[nodiscard]] const RelayConfig& config() const { return config_; }

private:
    void begin_listening(int attempt);
    void begin_connecting(const std::string& address);
    void attempt_connect(int attempt);

    void on_accepted(std::shared_ptr<LineSession> session);
    void open_channel(std::shared_ptr<LineSession> session, RelayRole role);
    void read_from(const std::shared_ptr<LineSession>& session);
    void on_line(const std::shared_ptr<LineSession>& session, const std::string& line);
    void on_session_closed(const std::shared_ptr<LineSession>& session, const asio::error_code& ec);

    void teardown(const std::string& reason);
    void close_sessions();
    void set_state(RelayState next);

    EventBus& bus_;
    RelayConfig config_;

    RelayState state_ = RelayState::Idle;
    RelayRole role_ = RelayRole::None;
    std::string remote_address_;
    std::string target_address_;

    /// Bumped on every teardown; completions from an older epoch are dropped.
    std::uint64_t epoch_ = 0;
    /// A settle or bind-retry timer is armed while still Idle.
    bool pending_ = false;

    asio::steady_timer settle_timer_;
    asio::steady_timer retry_timer_;
    PeerServer server_;
    PeerClient client_;

    std::shared_ptr<LineSession> writer_;
    std::vector<std::shared_ptr<LineSession>> readers_;

    Subscription topology_sub_;
};

} // namespace beacon
