#include "lasertrack/control/AxisPidController.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace lasertrack::control {

AxisPidController::AxisPidController(std::string name,
                                     const core::AxisLimits& limits,
                                     const core::PidGains& pidGains,
                                     std::chrono::milliseconds sample,
                                     double maxStep)
: axisName(std::move(name))
, axisLimits(limits)
, gains(pidGains)
, sampleTime(sample)
, maxStepPerUpdate(maxStep) {
    if (sampleTime.count() <= 0) {
        throw std::invalid_argument("AxisPidController: sample time must be positive");
    }
    if (!(maxStepPerUpdate > 0.0)) {
        throw std::invalid_argument("AxisPidController: max step must be positive");
    }
}

PidState AxisPidController::initialState() const {
    PidState state;
    state.integral = axisLimits.midpoint();
    state.previousOutput = axisLimits.midpoint();
    state.sampleTime = sampleTime;
    return state;
}

double AxisPidController::angleScaledError(double targetNormalized, double currentNormalized) const {
    return (std::clamp(targetNormalized, 0.0, 1.0) - std::clamp(currentNormalized, 0.0, 1.0))
        * axisLimits.range();
}

std::optional<double> AxisPidController::update(PidState& state, double error, Clock::time_point now) const {
    double dt = std::chrono::duration<double>(state.sampleTime).count();
    if (state.lastUpdate) {
        const auto elapsed = now - *state.lastUpdate;
        if (elapsed < state.sampleTime) {
            return std::nullopt;
        }
        dt = std::chrono::duration<double>(elapsed).count();
    }

    const double proportional = gains.kp * error;

    // The integral carries the absolute position, so it is bounded by the
    // axis limits to stop wind-up against an end stop.
    state.integral = axisLimits.clamp(state.integral + gains.ki * error * dt);

    const double derivative = state.lastUpdate
        ? gains.kd * (error - state.previousError) / dt
        : 0.0;

    double output = axisLimits.clamp(proportional + state.integral + derivative);

    const double step = output - state.previousOutput;
    if (std::abs(step) > maxStepPerUpdate) {
        output = state.previousOutput + std::copysign(maxStepPerUpdate, step);
    }

    state.previousError = error;
    state.previousOutput = output;
    state.lastUpdate = now;
    return output;
}

} // namespace lasertrack::control
