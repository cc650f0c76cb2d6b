#include "lasertrack/actuator/SimulatedServoController.hpp"

#include "lasertrack/actuator/ActuatorConfig.hpp"
#include "lasertrack/control/CoordinateNormalizer.hpp"
#include "lasertrack/log/Log.hpp"

namespace lasertrack::actuator {

SimulatedServoController::SimulatedServoController()
: SimulatedServoController(defaultLimits()) {}

SimulatedServoController::SimulatedServoController(const core::ServoLimits& limits)
: servoLimits(limits) {
    centre();
}

core::ServoLimits SimulatedServoController::defaultLimits() {
    core::ServoLimits limits;
    limits.horizontal = core::AxisLimits{config::SIM_H_MIN, config::SIM_H_MAX};
    limits.vertical = core::AxisLimits{config::SIM_V_MIN, config::SIM_V_MAX};
    return limits;
}

void SimulatedServoController::centre() {
    current.h = servoLimits.horizontal.midpoint();
    current.v = servoLimits.vertical.midpoint();
}

SimulatedServoController::Reply SimulatedServoController::handle(std::string_view requestLine) {
    std::lock_guard lock(mutex);
    ++requests;

    auto command = protocol::parseCommand(requestLine);
    if (!command) {
        logError("[SimulatedServoController] rejected request '", requestLine, "'\n");
        return Reply{protocol::encodeAck(false), false};
    }
    return dispatch(*command);
}

SimulatedServoController::Reply SimulatedServoController::dispatch(const ActuatorCommand& command) {
    switch (command.kind) {
        case CommandKind::SetAngles:
            current.h = servoLimits.horizontal.clamp(command.first);
            current.v = servoLimits.vertical.clamp(command.second);
            ++writes;
            return Reply{protocol::encodeAck(true), false};

        case CommandKind::SetNormalized: {
            const bool inRange = command.first >= 0.0 && command.first <= 1.0
                && command.second >= 0.0 && command.second <= 1.0;
            if (!inRange) {
                return Reply{protocol::encodeAck(false), false};
            }
            const control::CoordinateNormalizer normalizer(servoLimits);
            current = normalizer.normalizedToServo(core::NormalizedPoint{command.first, command.second});
            ++writes;
            return Reply{protocol::encodeAck(true), false};
        }

        case CommandKind::LaserOn:
            laser = true;
            return Reply{protocol::encodeAck(true), false};

        case CommandKind::LaserOff:
            laser = false;
            ++offCommands;
            return Reply{protocol::encodeAck(true), false};

        case CommandKind::QueryAngles:
            return Reply{protocol::encodeAngles(current), false};

        case CommandKind::QueryLimits:
            return Reply{protocol::encodeLimits(servoLimits), false};

        case CommandKind::SelfTestStart:
            selfTest = true;
            leg = SweepLeg::HorizontalUp;
            current.h = servoLimits.horizontal.min;
            current.v = servoLimits.vertical.min;
            return Reply{protocol::encodeAck(true), false};

        case CommandKind::SelfTestStop:
            selfTest = false;
            centre();
            return Reply{protocol::encodeAck(true), false};

        case CommandKind::Version:
            return Reply{protocol::encodeVersion(config::ACTUATOR_PROTOCOL_VERSION), false};

        case CommandKind::Quit:
            return Reply{protocol::encodeAck(true), true};
    }
    return Reply{protocol::encodeAck(false), false};
}

// The sweep traces the rectangle of reachable angles: horizontal min->max,
// vertical min->max, then both back down.
void SimulatedServoController::tickSelfTest() {
    std::lock_guard lock(mutex);
    if (!selfTest) {
        return;
    }

    const double step = config::SIM_SELF_TEST_STEP_DEG;
    const auto& h = servoLimits.horizontal;
    const auto& v = servoLimits.vertical;
    switch (leg) {
        case SweepLeg::HorizontalUp:
            current.h = h.clamp(current.h + step);
            if (current.h >= h.max) leg = SweepLeg::VerticalUp;
            break;
        case SweepLeg::VerticalUp:
            current.v = v.clamp(current.v + step);
            if (current.v >= v.max) leg = SweepLeg::HorizontalDown;
            break;
        case SweepLeg::HorizontalDown:
            current.h = h.clamp(current.h - step);
            if (current.h <= h.min) leg = SweepLeg::VerticalDown;
            break;
        case SweepLeg::VerticalDown:
            current.v = v.clamp(current.v - step);
            if (current.v <= v.min) leg = SweepLeg::HorizontalUp;
            break;
    }
}

core::ServoAngles SimulatedServoController::angles() const {
    std::lock_guard lock(mutex);
    return current;
}

core::ServoLimits SimulatedServoController::limits() const {
    std::lock_guard lock(mutex);
    return servoLimits;
}

bool SimulatedServoController::laserOn() const {
    std::lock_guard lock(mutex);
    return laser;
}

bool SimulatedServoController::selfTestRunning() const {
    std::lock_guard lock(mutex);
    return selfTest;
}

std::size_t SimulatedServoController::angleWrites() const {
    std::lock_guard lock(mutex);
    return writes;
}

std::size_t SimulatedServoController::laserOffCommands() const {
    std::lock_guard lock(mutex);
    return offCommands;
}

std::size_t SimulatedServoController::requestsHandled() const {
    std::lock_guard lock(mutex);
    return requests;
}

} // namespace lasertrack::actuator
