#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "network/line_session.h"

namespace beacon {

/**
 * Listening endpoint used when this device is the coordinator.
 *
 * Every accepted connection is handed out as a LineSession; the accept loop
 * keeps running until stop() or a fatal accept error.
 */
class PeerServer {
public:
    using SessionCallback = std::function<void(std::shared_ptr<LineSession> session)>;
    using ErrorCallback   = std::function<void(const asio::error_code& ec)>;

    PeerServer(asio::io_context& io, uint16_t port);

    /// Open, bind and listen. Already listening is a no-op success.
    asio::error_code start();
    void stop();

    void set_on_session(SessionCallback cb) { on_session_ = std::move(cb); }
    void set_on_error(ErrorCallback cb) { on_error_ = std::move(cb); }

    [[nodiscard]] bool listening() const { return acceptor_.is_open(); }

    /// Bound port; differs from the configured one only when configured as 0.
    [[nodiscard]] uint16_t port() const { return bound_port_; }

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    SessionCallback on_session_;
    ErrorCallback on_error_;
};

} // namespace beacon
