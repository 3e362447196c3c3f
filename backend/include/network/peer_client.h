#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "network/line_session.h"

namespace beacon {

/**
 * Single-attempt TCP connector to the coordinator's listening endpoint.
 *
 * Retry policy lives in the SocketRelay; this class only resolves, connects
 * (bounded by a timeout) and hands back a LineSession.
 */
class PeerClient {
public:
    using ConnectCallback = std::function<void(const asio::error_code& ec,
                                               std::shared_ptr<LineSession> session)>;

    explicit PeerClient(asio::io_context& io,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    /// Start one connection attempt; a previous attempt is cancelled silently.
    void connect(const std::string& address, uint16_t port, ConnectCallback cb);

    /// Abandon the in-flight attempt without invoking its callback.
    void cancel();

private:
    struct Attempt;
    static void finish(const std::shared_ptr<Attempt>& attempt, const asio::error_code& ec);

    asio::io_context& io_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Attempt> current_;
};

} // namespace beacon
