/**
 * @brief Implements the servo controller link: connection, throttling, and the one-retry failure policy.
 */
#include "lasertrack/actuator/TcpActuatorLink.hpp"

#include "lasertrack/core/Errors.hpp"
#include "lasertrack/log/Log.hpp"
#include "lasertrack/net/Resolve.hpp"

#include <string>
#include <thread>

namespace lasertrack::actuator {

using lasertrack::expected;
using lasertrack::unexpected;
namespace asio = lasertrack::net::asio;

namespace {

// Socket deadlines surface as asio::error::timed_out; report them in our taxonomy.
std::error_code classify(const std::error_code& ec) {
    if (ec == asio::error::timed_out) {
        return make_error_code(errc::actuator_timeout);
    }
    return ec;
}

expected<void> ackResult(std::string_view line) {
    auto ack = protocol::parseAck(line);
    if (!ack) {
        return unexpected(ack.error());
    }
    if (!*ack) {
        return unexpected(errc::command_rejected);
    }
    return {};
}

} // namespace

TcpActuatorLink::TcpActuatorLink() {
    setTimeouts(config::ACTUATOR_IO_TIMEOUT, config::ACTUATOR_CONNECT_TIMEOUT);
}

TcpActuatorLink::~TcpActuatorLink() {
    close();
}

void TcpActuatorLink::setTimeouts(std::chrono::milliseconds io, std::chrono::milliseconds connect) {
    tcpClient.setTimeouts(net::TimeoutConfig{io, connect});
}

expected<void>
TcpActuatorLink::connect(const std::string& host, unsigned short port) {
    auto resolved = net::resolve(host, port);
    if (!resolved) {
        logError("[TcpActuatorLink] cannot resolve ", host, ": ", resolved.error().message(), "\n");
        return unexpected(resolved.error());
    }
    const auto& endpoints = *resolved;

    if (auto ec = tcpClient.connect(endpoints); ec) {
        logError("[TcpActuatorLink] connect failed: ", ec.message(),
                 " (to ", host, ":", port, ")",
                 " timeout=", tcpClient.timeouts().connect.count(), "ms\n");
        return unexpected(classify(ec));
    }

    tcpClient.setLowLatency();
    rememberedEndpoints = endpoints;
    rememberedHost = host;
    unreachable = false;

    logInfo("[TcpActuatorLink] connected to ", host, ":", port, "\n");
    return {};
}

void TcpActuatorLink::close() {
    if (!tcpClient.is_open()) {
        return;
    }
    logInfo("[TcpActuatorLink] close()\n");
    tcpClient.close();
}

bool TcpActuatorLink::isConnected() const {
    return tcpClient.is_open();
}

void TcpActuatorLink::beginSession(std::chrono::milliseconds interval) {
    minCommandInterval = interval.count() < 0 ? std::chrono::milliseconds{0} : interval;
    unreachable = false;
}

void TcpActuatorLink::markUnreachable(std::string_view where, const std::error_code& ec) {
    logError("[TcpActuatorLink] ", where, " failed twice (", ec.message(),
             "), controller at ", rememberedHost.empty() ? "<unknown>" : rememberedHost,
             " marked unreachable\n");
    unreachable = true;
    tcpClient.close();
}

void TcpActuatorLink::waitForCommandSlot() {
    if (!lastCommandTime || minCommandInterval.count() == 0) {
        return;
    }
    const auto nextSlot = *lastCommandTime + minCommandInterval;
    const auto now = std::chrono::steady_clock::now();
    if (now < nextSlot) {
        std::this_thread::sleep_for(nextSlot - now);
    }
}

expected<void> TcpActuatorLink::reconnect() {
    if (!rememberedEndpoints) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    logInfo("[TcpActuatorLink] reconnecting to ", rememberedHost, "\n");
    if (auto ec = tcpClient.connect(*rememberedEndpoints); ec) {
        return unexpected(classify(ec));
    }
    tcpClient.setLowLatency();
    return {};
}

expected<std::string> TcpActuatorLink::exchangeOnce(const std::string& request) {
    if (!tcpClient.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    const std::string line = request + '\n';
    lastCommandTime = std::chrono::steady_clock::now();
    if (auto ec = tcpClient.write_all(line.data(), line.size()); ec) {
        return unexpected(classify(ec));
    }

    std::string reply;
    if (auto ec = tcpClient.read_line(reply); ec) {
        return unexpected(classify(ec));
    }
    return reply;
}

template <typename Parse>
auto TcpActuatorLink::transact(const ActuatorCommand& command, Parse parse)
    -> decltype(parse(std::string_view{})) {
    if (unreachable) {
        return unexpected(errc::actuator_unreachable);
    }

    const std::string request = protocol::encodeCommand(command);
    std::error_code lastError;

    for (int attempt = 0; attempt < 2; ++attempt) {
        if (attempt > 0 || !tcpClient.is_open()) {
            if (auto rc = reconnect(); !rc) {
                lastError = rc.error();
                logError("[TcpActuatorLink] reconnect failed: ", lastError.message(), "\n");
                continue;
            }
        }

        waitForCommandSlot();
        auto reply = exchangeOnce(request);
        if (reply) {
            auto parsed = parse(*reply);
            if (parsed || !isTransportFailure(parsed.error())) {
                return parsed;
            }
            lastError = parsed.error();
            logError("[TcpActuatorLink] bad reply '", *reply, "' to '", request, "'\n");
        } else {
            lastError = reply.error();
            logError("[TcpActuatorLink] '", request, "' failed: ", lastError.message(), "\n");
        }
        tcpClient.close();
    }

    markUnreachable(toString(command.kind), lastError);
    return unexpected(errc::actuator_unreachable);
}

expected<void> TcpActuatorLink::expectAck(const ActuatorCommand& command) {
    return transact(command, ackResult);
}

expected<core::ServoLimits> TcpActuatorLink::queryLimits() {
    return transact(ActuatorCommand::simple(CommandKind::QueryLimits),
                    [](std::string_view line) { return protocol::parseLimits(line); });
}

expected<core::ServoAngles> TcpActuatorLink::queryAngles() {
    return transact(ActuatorCommand::simple(CommandKind::QueryAngles),
                    [](std::string_view line) { return protocol::parseAngles(line); });
}

expected<void> TcpActuatorLink::setAngles(const core::ServoAngles& angles) {
    return expectAck(ActuatorCommand::setAngles(angles));
}

expected<void> TcpActuatorLink::setNormalized(const core::NormalizedPoint& point) {
    return expectAck(ActuatorCommand::setNormalized(point.clamped()));
}

expected<void> TcpActuatorLink::setLaser(bool on) {
    return expectAck(ActuatorCommand::simple(on ? CommandKind::LaserOn : CommandKind::LaserOff));
}

expected<void> TcpActuatorLink::setSelfTest(bool running) {
    return expectAck(ActuatorCommand::simple(running ? CommandKind::SelfTestStart
                                                     : CommandKind::SelfTestStop));
}

expected<void> TcpActuatorLink::forceLaserOff() {
    if (!unreachable) {
        return setLaser(false);
    }

    // Unreachable means the controller stopped answering in time, not that it
    // lost power; the emitter may still be on.
    logInfo("[TcpActuatorLink] unreachable, trying one fresh connection to switch the laser off\n");
    tcpClient.close();
    if (auto rc = reconnect(); !rc) {
        logError("[TcpActuatorLink] laser off: reconnect failed: ", rc.error().message(), "\n");
        return unexpected(errc::actuator_unreachable);
    }

    waitForCommandSlot();
    auto reply = exchangeOnce(protocol::encodeCommand(ActuatorCommand::simple(CommandKind::LaserOff)));
    if (!reply) {
        logError("[TcpActuatorLink] laser off: ", reply.error().message(), "\n");
        tcpClient.close();
        return unexpected(errc::actuator_unreachable);
    }
    return ackResult(*reply);
}

expected<int> TcpActuatorLink::queryProtocolVersion() {
    return transact(ActuatorCommand::simple(CommandKind::Version),
                    [](std::string_view line) { return protocol::parseVersion(line); });
}

expected<void> TcpActuatorLink::quit() {
    auto ack = expectAck(ActuatorCommand::simple(CommandKind::Quit));
    tcpClient.close();
    return ack;
}

} // namespace lasertrack::actuator
