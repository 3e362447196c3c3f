/**
 * SocketRelay - application byte stream layered on the ad-hoc topology.
 *
 *   Idle -> Listening | Connecting -> Open -> Closing -> Idle
 *
 * Every async completion captures the epoch it was started in. teardown()
 * bumps the epoch, so accepts, connects and buffered lines that complete
 * after the stream was closed are discarded instead of published.
 */

#include "network/socket_relay.h"
#include "protocol/envelope.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace beacon {

SocketRelay::SocketRelay(asio::io_context& io, EventBus& bus, RelayConfig config)
    : bus_(bus),
      config_(std::move(config)),
      settle_timer_(io),
      retry_timer_(io),
      server_(io, config_.port),
      client_(io, config_.connect_timeout) {
    server_.set_on_session([this](std::shared_ptr<LineSession> session) {
        on_accepted(std::move(session));
    });
    server_.set_on_error([this](const asio::error_code& ec) {
        teardown("accept failed: " + ec.message());
    });
    topology_sub_ = bus_.topology.subscribe(
        [this](const events::TopologyChanged& change) { handle_topology(change); });
}

SocketRelay::~SocketRelay() {
    // No events here: subscribers may already be gone.
    topology_sub_.reset();
    ++epoch_;
    settle_timer_.cancel();
    retry_timer_.cancel();
    client_.cancel();
    server_.stop();
    close_sessions();
}

void SocketRelay::handle_topology(const events::TopologyChanged& change) {
    if (!change.connected) {
        teardown("topology lost");
        return;
    }

    if (state_ != RelayState::Idle || pending_) {
        spdlog::debug("relay: topology update while {}, ignored", to_string(state_));
        return;
    }

    std::string address;
    if (!change.is_coordinator) {
        if (!change.coordinator_address || change.coordinator_address->empty()) {
            spdlog::warn("relay: topology formed without a coordinator address");
            return;
        }
        address = *change.coordinator_address;
    }

    pending_ = true;
    const auto epoch = epoch_;
    const bool coordinator = change.is_coordinator;
    spdlog::info("relay: topology formed ({}), settling for {} ms",
                 coordinator ? "coordinator" : "client", config_.settle_delay.count());

    settle_timer_.expires_after(config_.settle_delay);
    settle_timer_.async_wait([this, epoch, coordinator, address](const asio::error_code& ec) {
        if (ec || epoch != epoch_) return;
        pending_ = false;
        if (coordinator) {
            begin_listening(0);
        } else {
            begin_connecting(address);
        }
    });
}

void SocketRelay::begin_listening(int attempt) {
    if (server_.listening()) {
        spdlog::debug("relay: already listening");
        if (state_ == RelayState::Idle) set_state(RelayState::Listening);
        return;
    }

    asio::error_code ec = server_.start();
    if (!ec) {
        role_ = RelayRole::Listener;
        set_state(RelayState::Listening);
        return;
    }

    if (attempt == 0) {
        spdlog::warn("relay: listen failed ({}), retrying in {} ms",
                     ec.message(), config_.backoff_step.count());
        pending_ = true;
        const auto epoch = epoch_;
        retry_timer_.expires_after(config_.backoff_step);
        retry_timer_.async_wait([this, epoch](const asio::error_code& wait_ec) {
            if (wait_ec || epoch != epoch_) return;
            pending_ = false;
            begin_listening(1);
        });
        return;
    }

    spdlog::error("relay: giving up on listening: {}", ec.message());
    bus_.socket.publish(events::SocketConnectFailed{
        "0.0.0.0:" + std::to_string(config_.port), ec.message()});
}

void SocketRelay::begin_connecting(const std::string& address) {
    target_address_ = address;
    role_ = RelayRole::Connector;
    set_state(RelayState::Connecting);
    attempt_connect(0);
}

void SocketRelay::attempt_connect(int attempt) {
    const auto epoch = epoch_;
    retry_timer_.expires_after(config_.backoff_step * attempt);
    retry_timer_.async_wait([this, epoch, attempt](const asio::error_code& wait_ec) {
        if (wait_ec || epoch != epoch_) return;
        if (attempt > 0) {
            spdlog::info("relay: retry {} connecting to {}", attempt, target_address_);
        }

        client_.connect(target_address_, config_.port,
            [this, epoch, attempt](const asio::error_code& ec, std::shared_ptr<LineSession> session) {
                if (epoch != epoch_) {
                    if (session) session->close();
                    return;
                }
                if (!ec) {
                    spdlog::info("relay: connected to {} on attempt {}", target_address_, attempt + 1);
                    open_channel(std::move(session), RelayRole::Connector);
                    return;
                }
                if (attempt + 1 < config_.connect_attempts) {
                    attempt_connect(attempt + 1);
                    return;
                }

                spdlog::error("relay: failed to connect to {} after {} attempts: {}",
                              target_address_, config_.connect_attempts, ec.message());
                role_ = RelayRole::None;
                set_state(RelayState::Idle);
                bus_.socket.publish(events::SocketConnectFailed{target_address_, ec.message()});
            });
    });
}

void SocketRelay::on_accepted(std::shared_ptr<LineSession> session) {
    if (state_ != RelayState::Listening && state_ != RelayState::Open) {
        session->close();
        return;
    }
    if (!writer_) {
        open_channel(std::move(session), RelayRole::Listener);
        return;
    }

    spdlog::warn("relay: extra connection from {} while open, reading only",
                 session->remote_address());
    readers_.push_back(session);
    read_from(session);
}

void SocketRelay::open_channel(std::shared_ptr<LineSession> session, RelayRole role) {
    writer_ = session;
    role_ = role;
    remote_address_ = session->remote_address();
    set_state(RelayState::Open);
    bus_.socket.publish(events::SocketConnected{role, remote_address_});

    // A SocketConnected subscriber may already have torn the relay down.
    if (writer_ == session) {
        read_from(session);
    }
}

void SocketRelay::read_from(const std::shared_ptr<LineSession>& session) {
    const auto epoch = epoch_;
    std::weak_ptr<LineSession> weak = session;
    session->start(
        [this, epoch, weak](const std::string& line) {
            auto s = weak.lock();
            if (!s || epoch != epoch_) return;
            on_line(s, line);
        },
        [this, epoch, weak](const asio::error_code& ec) {
            auto s = weak.lock();
            if (!s || epoch != epoch_) return;
            on_session_closed(s, ec);
        });
}

void SocketRelay::on_line(const std::shared_ptr<LineSession>& session, const std::string& line) {
    if (state_ != RelayState::Open) {
        return;
    }
    auto parsed = envelope::parse(line, config_.local_id, session->remote_address(),
                                  std::chrono::system_clock::now());
    bus_.message.publish(events::MessageReceived{
        std::move(parsed.message), session->remote_address(), parsed.plain_text});
}

void SocketRelay::on_session_closed(const std::shared_ptr<LineSession>& session,
                                    const asio::error_code& ec) {
    auto it = std::find(readers_.begin(), readers_.end(), session);
    if (it != readers_.end()) {
        spdlog::info("relay: extra connection from {} ended", session->remote_address());
        readers_.erase(it);
        return;
    }
    if (session != writer_) {
        return;
    }

    const std::string reason = ec == asio::error::eof ? "peer closed the stream" : ec.message();
    const RelayRole role = role_;

    set_state(RelayState::Closing);
    close_sessions();
    remote_address_.clear();
    bus_.socket.publish(events::SocketDisconnected{reason});
    set_state(RelayState::Idle);

    // The topology is still up: the coordinator keeps accepting reconnects.
    if (role == RelayRole::Listener && server_.listening()) {
        set_state(RelayState::Listening);
    } else {
        role_ = RelayRole::None;
    }
}

Status SocketRelay::send(const std::string& line, SendCallback on_complete) {
    if (state_ != RelayState::Open || !writer_ || !writer_->is_open()) {
        return Status(ErrorCode::NotConnected);
    }

    writer_->write_line(line, [on_complete = std::move(on_complete)](const asio::error_code& ec) {
        if (ec) {
            spdlog::warn("relay: send failed: {}", ec.message());
        }
        if (on_complete) {
            on_complete(ec ? Status(ErrorCode::SendFailed, ec.message()) : Status::success());
        }
    });
    return Status::success();
}

void SocketRelay::stop() {
    teardown("stopped");
}

void SocketRelay::teardown(const std::string& reason) {
    const bool active = state_ != RelayState::Idle || pending_;

    ++epoch_;
    pending_ = false;
    settle_timer_.cancel();
    retry_timer_.cancel();
    client_.cancel();

    if (!active) {
        server_.stop();
        return;
    }

    spdlog::info("relay: closing ({})", reason);
    set_state(RelayState::Closing);
    server_.stop();
    close_sessions();
    role_ = RelayRole::None;
    remote_address_.clear();
    bus_.socket.publish(events::SocketDisconnected{reason});
    set_state(RelayState::Idle);
}

void SocketRelay::close_sessions() {
    if (writer_) {
        writer_->close();
        writer_.reset();
    }
    for (auto& reader : readers_) {
        reader->close();
    }
    readers_.clear();
}

void SocketRelay::set_state(RelayState next) {
    if (state_ == next) {
        return;
    }
    spdlog::debug("relay: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
    bus_.socket.publish(events::RelayStateChanged{next});
}

} // namespace beacon
