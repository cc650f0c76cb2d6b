#pragma once

#include "lasertrack/actuator/ActuatorConfig.hpp"
#include "lasertrack/actuator/ActuatorLink.hpp"
#include "lasertrack/actuator/ActuatorProtocol.hpp"
#include "lasertrack/net/NetConfig.hpp"
#include "lasertrack/net/TcpClient.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace lasertrack::actuator {

/**
 * @brief `ActuatorLink` over a persistent TCP connection.
 *
 * Requests and replies are single text lines (see ActuatorProtocol.hpp).
 * Socket work runs on the shared `NetService` loop; the calling thread blocks
 * under the deadlines configured with `setTimeouts`.
 *
 * The resolved endpoints of the last successful `connect()` are remembered so
 * the link can reconnect on its own after a failure.
 */
class TcpActuatorLink : public ActuatorLink {
public:
    TcpActuatorLink();
    ~TcpActuatorLink() override;

    // non-copyable / non-movable
    TcpActuatorLink(const TcpActuatorLink&) = delete;
    TcpActuatorLink& operator=(const TcpActuatorLink&) = delete;
    TcpActuatorLink(TcpActuatorLink&&) = delete;
    TcpActuatorLink& operator=(TcpActuatorLink&&) = delete;

    /**
     * @brief Resolve @p host and connect to the controller.
     * @param host Host name or dotted quad.
     * @param port Controller TCP port (defaults to 15555).
     */
    expected<void> connect(const std::string& host,
                           unsigned short port = config::ACTUATOR_PORT_DEFAULT);

    void close();                 // idempotent
    bool isConnected() const;

    void setTimeouts(std::chrono::milliseconds io, std::chrono::milliseconds connect);

    void beginSession(std::chrono::milliseconds minCommandInterval) override;
    bool isUnreachable() const override { return unreachable; }

    expected<core::ServoLimits> queryLimits() override;
    expected<core::ServoAngles> queryAngles() override;
    expected<void> setAngles(const core::ServoAngles& angles) override;
    expected<void> setNormalized(const core::NormalizedPoint& point) override;
    expected<void> setLaser(bool on) override;
    expected<void> setSelfTest(bool running) override;
    expected<void> forceLaserOff() override;
    expected<int> queryProtocolVersion() override;
    expected<void> quit() override;

private:
    /// Send @p command, parse the reply, retry once over a fresh connection on transport failure.
    template <typename Parse>
    auto transact(const ActuatorCommand& command, Parse parse)
        -> decltype(parse(std::string_view{}));

    expected<void> expectAck(const ActuatorCommand& command);

    expected<std::string> exchangeOnce(const std::string& request);
    expected<void> reconnect();
    void waitForCommandSlot();
    void markUnreachable(std::string_view where, const std::error_code& ec);

    net::TcpClient tcpClient;
    std::optional<net::tcp::resolver::results_type> rememberedEndpoints{};
    std::string rememberedHost;
    std::chrono::milliseconds minCommandInterval{0};
    std::optional<std::chrono::steady_clock::time_point> lastCommandTime{};
    bool unreachable = false;
};

} // namespace lasertrack::actuator
