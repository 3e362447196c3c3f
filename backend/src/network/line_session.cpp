/**
 * LineSession - newline-delimited reader/writer over one TCP socket.
 */

#include "network/line_session.h"

#include <istream>

#include <spdlog/spdlog.h>

namespace beacon {

LineSession::LineSession(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)), buffer_(kMaxLineBytes) {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        spdlog::debug("session: remote endpoint unavailable: {}", ec.message());
        remote_address_ = "unknown";
    } else {
        remote_address_ = endpoint.address().to_string();
    }
}

void LineSession::start(LineHandler on_line, CloseHandler on_close) {
    if (started_ || closed_) {
        return;
    }
    started_ = true;
    on_line_ = std::move(on_line);
    on_close_ = std::move(on_close);
    do_read();
}

void LineSession::do_read() {
    asio::async_read_until(socket_, buffer_, '\n',
        [self = shared_from_this()](const asio::error_code& ec, std::size_t length) {
            if (self->closed_) {
                return;
            }

            if (ec) {
                // The platform reader hands over a final unterminated line at EOF.
                if (ec == asio::error::eof && self->buffer_.size() > 0) {
                    std::string rest(asio::buffers_begin(self->buffer_.data()),
                                     asio::buffers_end(self->buffer_.data()));
                    self->buffer_.consume(self->buffer_.size());
                    if (!rest.empty() && rest.back() == '\r') rest.pop_back();
                    if (!rest.empty() && self->on_line_) self->on_line_(rest);
                    if (self->closed_) return;
                }
                self->fail(ec);
                return;
            }

            std::string line(asio::buffers_begin(self->buffer_.data()),
                             asio::buffers_begin(self->buffer_.data()) + static_cast<std::ptrdiff_t>(length));
            self->buffer_.consume(length);

            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
            if (!line.empty() && self->on_line_) {
                self->on_line_(line);
            }
            if (!self->closed_) {
                self->do_read();
            }
        });
}

void LineSession::write_line(std::string line, WriteHandler done) {
    if (closed_) {
        if (done) {
            asio::post(socket_.get_executor(),
                       [done = std::move(done)]() { done(asio::error::not_connected); });
        }
        return;
    }
    line.push_back('\n');
    write_queue_.emplace_back(std::move(line), std::move(done));
    if (write_queue_.size() == 1) {
        do_write();
    }
}

void LineSession::do_write() {
    asio::async_write(socket_, asio::buffer(write_queue_.front().first),
        [self = shared_from_this()](const asio::error_code& ec, std::size_t /*bytes*/) {
            auto item = std::move(self->write_queue_.front());
            self->write_queue_.pop_front();

            if (ec) {
                // Everything queued behind a failed write fails the same way.
                auto pending = std::move(self->write_queue_);
                self->write_queue_.clear();
                if (item.second) item.second(ec);
                for (auto& queued : pending) {
                    if (queued.second) queued.second(ec);
                }
                return;
            }

            if (!self->write_queue_.empty()) {
                self->do_write();
            }
            if (item.second) item.second(ec);
        });
}

void LineSession::fail(const asio::error_code& ec) {
    if (ec == asio::error::eof) {
        spdlog::info("session: {} closed the stream", remote_address_);
    } else {
        spdlog::warn("session: read from {} failed: {}", remote_address_, ec.message());
    }
    close();
    if (on_close_) {
        auto handler = std::move(on_close_);
        on_close_ = nullptr;
        handler(ec);
    }
}

void LineSession::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        spdlog::debug("session: shutdown {}: {}", remote_address_, ec.message());
    }
    socket_.close(ec);
    if (ec) {
        spdlog::debug("session: close {}: {}", remote_address_, ec.message());
    }
}

} // namespace beacon
