#pragma once
#include "lasertrack/net/NetConfig.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace lasertrack::net {

/**
 * @brief Owns the io_context that completes actuator socket operations.
 *
 * `TcpClient` blocks its calling thread (the session worker) on a future while
 * the connect, write and read handlers run here. One background thread serves
 * every link in the process.
 *
 * A handler that throws is logged and the loop is re-entered, so one bad
 * completion cannot leave every later actuator call waiting on a dead loop.
 *
 * Links must be destroyed before the service; the process-wide instance
 * behind `io_context()` lives until static destruction.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

    /// Handlers that escaped with an exception since construction.
    std::size_t handlerFailures() const { return handlerFailures_.load(); }

private:
    void runLoop();

    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::atomic<std::size_t> handlerFailures_{0};
    std::thread thread_;
};

std::shared_ptr<asio::io_context> shared_io_context();
asio::io_context& io_context();

} // namespace lasertrack::net
