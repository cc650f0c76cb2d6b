#include "lasertrack/net/NetService.hpp"
#include "lasertrack/log/Log.hpp"

#include <exception>

namespace lasertrack::net {

NetService::NetService()
: io_(std::make_shared<asio::io_context>(1))
, work_(asio::make_work_guard(*io_))
, thread_([this] { runLoop(); })
{
    logInfo("[NetService] actuator I/O thread running\n");
}

NetService::~NetService() {
    work_.reset();
    io_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void NetService::runLoop() {
    while (!io_->stopped()) {
        try {
            io_->run();
        } catch (const std::exception& e) {
            ++handlerFailures_;
            logError("[NetService] handler threw: ", e.what(), "\n");
        }
    }
}

namespace {
NetService& processService() {
    static NetService service;
    return service;
}
} // namespace

std::shared_ptr<asio::io_context> shared_io_context() {
    return processService().io();
}

asio::io_context& io_context() {
    return *processService().io();
}

} // namespace lasertrack::net
