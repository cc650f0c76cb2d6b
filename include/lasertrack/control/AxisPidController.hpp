#pragma once

#include "lasertrack/core/Geometry.hpp"
#include "lasertrack/core/TargetingConfig.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lasertrack::control {

using Clock = std::chrono::steady_clock;

/**
 * @brief Mutable state of one axis loop.
 *
 * Owned by the session that drives the axis and passed into every update, so
 * two sessions (or two tests) can never share a loop.
 */
struct PidState {
    double integral = 0.0;
    double previousError = 0.0;
    double previousOutput = 0.0;
    std::chrono::milliseconds sampleTime = config::PID_SAMPLE_TIME;
    std::optional<Clock::time_point> lastUpdate{};
};

/**
 * @brief PID loop for one servo axis producing absolute angles.
 *
 * Works on angle-scaled error, `(target - current) * axis range`, so the same
 * gains fit both axes whatever their mechanical range. The output is clamped
 * to the axis limits and then rate limited to `maxStepPerUpdate` degrees away
 * from the previous output.
 */
class AxisPidController {
public:
    AxisPidController(std::string name,
                      const core::AxisLimits& limits,
                      const core::PidGains& gains,
                      std::chrono::milliseconds sampleTime,
                      double maxStepPerUpdate);

    /// Fresh state whose first output is the axis midpoint.
    PidState initialState() const;

    double angleScaledError(double targetNormalized, double currentNormalized) const;

    /**
     * @brief Advance the loop by one sample.
     * @return The new output angle, or nullopt when less than `sampleTime` has
     *         passed since the previous update (state is left untouched).
     */
    std::optional<double> update(PidState& state, double error, Clock::time_point now) const;

    const std::string& name() const { return axisName; }
    const core::AxisLimits& limits() const { return axisLimits; }
    double maxStep() const { return maxStepPerUpdate; }

private:
    std::string axisName;
    core::AxisLimits axisLimits;
    core::PidGains gains;
    std::chrono::milliseconds sampleTime;
    double maxStepPerUpdate;
};

} // namespace lasertrack::control
