#pragma once

#include "lasertrack/actuator/ActuatorProtocol.hpp"
#include "lasertrack/core/Geometry.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace lasertrack::actuator {

/**
 * @brief In-process model of the remote servo/laser controller.
 *
 * Holds what the real controller owns (axis limits, current angles, laser
 * emission, the self-test sweep) and answers protocol lines the way the
 * controller firmware does. Used by the `servo_sim` app and by the loopback
 * tests. All members are thread-safe.
 *
 * Absolute angle requests are clamped to the limits. Normalized requests
 * outside [0,1] and anything outside the grammar are answered with "0".
 */
class SimulatedServoController {
public:
    struct Reply {
        std::string line;
        bool closeConnection = false;
    };

    SimulatedServoController();
    explicit SimulatedServoController(const core::ServoLimits& limits);

    static core::ServoLimits defaultLimits();

    /// Handle one request line (without '\n') and build the reply line.
    Reply handle(std::string_view requestLine);

    /// Advance the self-test sweep by one step; no-op while the sweep is stopped.
    void tickSelfTest();

    core::ServoAngles angles() const;
    core::ServoLimits limits() const;
    bool laserOn() const;
    bool selfTestRunning() const;
    std::size_t angleWrites() const;
    std::size_t laserOffCommands() const;
    std::size_t requestsHandled() const;

private:
    Reply dispatch(const ActuatorCommand& command);
    void centre();

    enum class SweepLeg { HorizontalUp, VerticalUp, HorizontalDown, VerticalDown };

    mutable std::mutex mutex;
    core::ServoLimits servoLimits;
    core::ServoAngles current{};
    bool laser = false;
    bool selfTest = false;
    SweepLeg leg = SweepLeg::HorizontalUp;
    std::size_t writes = 0;
    std::size_t offCommands = 0;
    std::size_t requests = 0;
};

} // namespace lasertrack::actuator
