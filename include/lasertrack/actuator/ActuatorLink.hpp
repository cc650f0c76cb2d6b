#pragma once

#include "lasertrack/core/Expected.hpp"
#include "lasertrack/core/Geometry.hpp"

#include <chrono>

namespace lasertrack::actuator {

/**
 * @brief Synchronous request/response access to the remote servo/laser controller.
 *
 * Every call blocks the caller until the controller answers, the deadline
 * passes, or the link gives up. Implementations enforce a minimum interval
 * between commands and, after a transport failure, retry once over a fresh
 * connection. A second failure makes the link unreachable: every call then
 * fails with `errc::actuator_unreachable` until the next `beginSession()`.
 *
 * A controller answering "0" yields `errc::command_rejected`; that is not a
 * transport failure and never triggers a reconnect.
 */
class ActuatorLink {
public:
    virtual ~ActuatorLink() = default;

    /// Clear the unreachable mark and set the minimum spacing between commands.
    virtual void beginSession(std::chrono::milliseconds minCommandInterval) = 0;
    virtual bool isUnreachable() const = 0;

    virtual expected<core::ServoLimits> queryLimits() = 0;
    virtual expected<core::ServoAngles> queryAngles() = 0;
    virtual expected<void> setAngles(const core::ServoAngles& angles) = 0;
    /// The controller converts with its own cached limits.
    virtual expected<void> setNormalized(const core::NormalizedPoint& point) = 0;
    virtual expected<void> setLaser(bool on) = 0;
    virtual expected<void> setSelfTest(bool running) = 0;

    /**
     * @brief Switch the laser off on the way out of a session, even past the unreachable mark.
     *
     * Behaves like `setLaser(false)` while the link is reachable. Once it is
     * marked unreachable, makes one fresh connection and sends "off" once,
     * bounded by the connect and I/O deadlines. The mark itself stays set.
     */
    virtual expected<void> forceLaserOff() = 0;
    virtual expected<int> queryProtocolVersion() = 0;
    /// Ask the controller to end the connection.
    virtual expected<void> quit() = 0;
};

} // namespace lasertrack::actuator
