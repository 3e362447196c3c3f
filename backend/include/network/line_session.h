#pragma once

#include <asio.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace beacon {

/**
 * One newline-framed TCP stream.
 *
 * Reads complete lines until the peer closes or an I/O error occurs, and
 * queues outbound lines so only one async_write is in flight. A local
 * close() is silent: only remote/I/O termination reaches the close handler.
 */
class LineSession : public std::enable_shared_from_this<LineSession> {
public:
    using LineHandler  = std::function<void(const std::string& line)>;
    using CloseHandler = std::function<void(const asio::error_code& ec)>;
    using WriteHandler = std::function<void(const asio::error_code& ec)>;

    /// Upper bound for one inbound line; longer input is treated as an I/O error.
    static constexpr std::size_t kMaxLineBytes = 64 * 1024;

    explicit LineSession(asio::ip::tcp::socket socket);

    void start(LineHandler on_line, CloseHandler on_close);

    /// Queue `line` (newline appended) for writing.
    void write_line(std::string line, WriteHandler done);

    void close();

    [[nodiscard]] bool is_open() const { return !closed_; }
    [[nodiscard]] const std::string& remote_address() const { return remote_address_; }

private:
    void do_read();
    void do_write();
    void fail(const asio::error_code& ec);

    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
    std::deque<std::pair<std::string, WriteHandler>> write_queue_;
    LineHandler on_line_;
    CloseHandler on_close_;
    std::string remote_address_;
    bool started_ = false;
    bool closed_ = false;
};

} // namespace beacon
