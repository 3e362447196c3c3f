/**
 * PeerServer - accepts stream connections on the coordinator.
 *
 * Uses standalone ASIO. Each accepted peer gets its own LineSession that
 * reads newline-delimited JSON envelopes off the wire.
 */

#include "network/peer_server.h"

#include <spdlog/spdlog.h>

namespace beacon {

PeerServer::PeerServer(asio::io_context& io, uint16_t port)
    : acceptor_(io), port_(port) {}

asio::error_code PeerServer::start() {
    if (acceptor_.is_open()) {
        spdlog::debug("server: already listening on port {}", bound_port_);
        return {};
    }

    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port_);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("server: cannot listen on port {}: {}", port_, ec.message());
        asio::error_code ignored;
        acceptor_.close(ignored);
        return ec;
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();
    if (ec) {
        bound_port_ = port_;
    }
    spdlog::info("server: listening on port {}", bound_port_);
    do_accept();
    return {};
}

void PeerServer::stop() {
    if (!acceptor_.is_open()) {
        return;
    }
    asio::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("server: closing acceptor: {}", ec.message());
    }
    spdlog::info("server: stopped listening on port {}", bound_port_);
}

void PeerServer::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            if (ec == asio::error::connection_aborted) {
                spdlog::debug("server: peer aborted before accept");
                do_accept();
                return;
            }
            spdlog::error("server: accept failed: {}", ec.message());
            asio::error_code ignored;
            acceptor_.close(ignored);
            if (on_error_) on_error_(ec);
            return;
        }

        auto session = std::make_shared<LineSession>(std::move(socket));
        spdlog::info("server: accepted connection from {}", session->remote_address());
        if (on_session_) {
            on_session_(session);
        } else {
            session->close();
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}

} // namespace beacon
