/**
 * PeerClient - connects to the coordinator's listening endpoint.
 *
 * Resolves the coordinator address, opens a TCP connection bounded by a
 * timeout, and hands the socket over as a LineSession.
 */

#include "network/peer_client.h"

#include <spdlog/spdlog.h>

namespace beacon {

struct PeerClient::Attempt {
    explicit Attempt(asio::io_context& io) : socket(io), resolver(io), timer(io) {}

    asio::ip::tcp::socket socket;
    asio::ip::tcp::resolver resolver;
    asio::steady_timer timer;
    std::string address;
    uint16_t port = 0;
    bool done = false;
    ConnectCallback callback;
};

PeerClient::PeerClient(asio::io_context& io, std::chrono::milliseconds timeout)
    : io_(io), timeout_(timeout) {}

void PeerClient::connect(const std::string& address, uint16_t port, ConnectCallback cb) {
    cancel();

    auto attempt = std::make_shared<Attempt>(io_);
    attempt->address = address;
    attempt->port = port;
    attempt->callback = std::move(cb);
    current_ = attempt;

    spdlog::info("client: connecting to {}:{}", address, port);

    attempt->timer.expires_after(timeout_);
    attempt->timer.async_wait([attempt](const asio::error_code& ec) {
        if (ec || attempt->done) return;
        spdlog::warn("client: connect to {}:{} timed out", attempt->address, attempt->port);
        attempt->resolver.cancel();
        asio::error_code ignored;
        attempt->socket.close(ignored);
        finish(attempt, asio::error::timed_out);
    });

    attempt->resolver.async_resolve(address, std::to_string(port),
        [attempt](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
            if (attempt->done) return;
            if (ec) {
                spdlog::warn("client: cannot resolve {}: {}", attempt->address, ec.message());
                finish(attempt, ec);
                return;
            }
            asio::async_connect(attempt->socket, results,
                [attempt](const asio::error_code& ec, const asio::ip::tcp::endpoint& /*endpoint*/) {
                    if (attempt->done) return;
                    if (ec) {
                        spdlog::warn("client: connect to {}:{} failed: {}",
                                     attempt->address, attempt->port, ec.message());
                    }
                    finish(attempt, ec);
                });
        });
}

void PeerClient::cancel() {
    if (!current_) {
        return;
    }
    auto attempt = std::move(current_);
    current_.reset();
    if (attempt->done) {
        return;
    }
    attempt->done = true;
    attempt->callback = nullptr;
    attempt->timer.cancel();
    attempt->resolver.cancel();
    asio::error_code ignored;
    attempt->socket.close(ignored);
}

void PeerClient::finish(const std::shared_ptr<Attempt>& attempt, const asio::error_code& ec) {
    attempt->done = true;
    attempt->timer.cancel();

    auto callback = std::move(attempt->callback);
    attempt->callback = nullptr;
    if (!callback) return;

    if (ec) {
        callback(ec, nullptr);
        return;
    }
    asio::error_code opt_ec;
    attempt->socket.set_option(asio::ip::tcp::no_delay(true), opt_ec);
    if (opt_ec) {
        spdlog::debug("client: TCP_NODELAY not set: {}", opt_ec.message());
    }
    callback({}, std::make_shared<LineSession>(std::move(attempt->socket)));
}

} // namespace beacon
