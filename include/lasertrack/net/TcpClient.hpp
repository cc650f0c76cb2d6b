#pragma once
#include "lasertrack/net/NetConfig.hpp"
#include "lasertrack/net/Deadline.hpp"
#include "lasertrack/net/TimeoutConfig.hpp"
#include "lasertrack/net/NetService.hpp"
#include "lasertrack/log/Log.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace lasertrack::net {
using duration = TimeoutConfig::duration;

/**
 * @brief Thin wrapper around `tcp::socket` that adds deadlines and low-latency options.
 *
 * Highlights:
 * - `connect(...)` retries endpoints and respects a per-attempt timeout.
 * - `write_all(...)` and `read_line(...)` block the caller while enforcing deadlines.
 * - `setLowLatency()` enables TCP_NODELAY and keepalive to reduce jitter.
 * - All socket work is serialized by a strand executor.
 *
 * The caller must keep the owning `asio::io_context` running while using the API.
 */
class TcpClient {
public:
    /// Longest line `read_line` accepts before failing with `message_size`.
    static constexpr std::size_t MAX_LINE_LENGTH = 256;

    TcpClient()
    : io_(shared_io_context())
    , socket_(*io_)
    , strand_(asio::make_strand(*io_))
    , timeouts_(TimeoutConfig::defaults())
    {}

    void setTimeouts(const TimeoutConfig& timeouts) { timeouts_ = timeouts.sanitized(); }
    const TimeoutConfig& timeouts() const { return timeouts_; }

    tcp::socket& socket() { return socket_; }

    // Each attempt resets the socket (and any half-read line) before connect_one().
    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        rxBuffer_ = std::make_shared<std::string>();
        return connect_one(endpoint, timeout);
    }

    std::error_code connect(const tcp::endpoint& endpoint) {
        return connect(endpoint, timeouts_.connect);
    }

    // Connect from resolver results (entries have .endpoint()); first success wins.
    template <typename Results>
    std::error_code connect(Results results, duration timeout,
                       decltype(std::declval<typename Results::value_type>().endpoint(), 0) = 0) {
        std::error_code last = asio::error::host_not_found;

        for (auto& e : results) {
            auto ec = connect(e.endpoint(), timeout);
            if (!ec) return ec;
            last = ec;
        }
        return last;
    }

    template <typename Results>
    std::error_code connect(Results results,
                       decltype(std::declval<typename Results::value_type>().endpoint(), 0) = 0) {
        return connect(results, timeouts_.connect);
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, TimeoutConfig::sanitize(timeout),
            [&](auto completion){
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
    }

    std::error_code write_all(const void* buf, std::size_t n) {
        return write_all(buf, n, timeouts_.io);
    }

    /**
     * @brief Read one '\n'-terminated line, without the terminator (and without a trailing '\r').
     *
     * Bytes received past the terminator are kept for the next call.
     */
    std::error_code read_line(std::string& line, duration timeout) {
        auto ex = socket_.get_executor();
        // When the deadline wins, the aborted read may still complete into the
        // buffer on the I/O thread. The operation keeps that buffer alive, and
        // close()/connect() swap in a fresh one instead of touching it.
        auto buffer = rxBuffer_;
        auto lineLength = std::make_shared<std::size_t>(0);
        auto ec = with_deadline(ex, TimeoutConfig::sanitize(timeout),
            [&](auto completion){
                asio::async_read_until(socket_, asio::dynamic_buffer(*buffer, MAX_LINE_LENGTH), '\n',
                    [buffer, lineLength, completion](const std::error_code& op_ec, std::size_t transferred){
                        *lineLength = transferred;
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
        if (ec) {
            // A late completion may still write here; never reuse it.
            rxBuffer_ = std::make_shared<std::string>();
            return ec;
        }

        const std::size_t consumed = *lineLength;
        line.assign(*buffer, 0, consumed > 0 ? consumed - 1 : 0);
        buffer->erase(0, consumed);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return {};
    }

    std::error_code read_line(std::string& line) {
        return read_line(line, timeouts_.io);
    }

    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
    }

    bool is_open() const { return socket_.is_open(); }

    // Best-effort cancellation of pending ops on the socket.
    void cancel() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        logInfo("[TcpClient] close()\n");
        std::error_code ec;
        // cancel -> shutdown -> close
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        rxBuffer_ = std::make_shared<std::string>();
    }

private:
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, TimeoutConfig::sanitize(timeout),
            [&](auto completion){ socket_.async_connect(ep, completion); },
            [this]{ cancel(); }
        );
    }

    std::shared_ptr<asio::io_context> io_;
    tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
    TimeoutConfig timeouts_;
    // Unconsumed bytes past the last line. Shared with the pending read.
    std::shared_ptr<std::string> rxBuffer_ = std::make_shared<std::string>();
};

} // namespace lasertrack::net
