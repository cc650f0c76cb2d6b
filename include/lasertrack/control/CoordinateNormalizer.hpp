#pragma once

#include "lasertrack/core/Geometry.hpp"

namespace lasertrack::control {

/**
 * @brief Maps between pixels, normalized [0,1] coordinates and servo angles.
 *
 * x drives the horizontal axis and y the vertical one. Every mapping clamps to
 * [0,1] first, so a detection outside the frame can never become an angle
 * outside the cached limits. `servoToNormalized` is the exact inverse of
 * `normalizedToServo` on [0,1]².
 */
class CoordinateNormalizer {
public:
    explicit CoordinateNormalizer(const core::ServoLimits& limits);

    static core::NormalizedPoint pixelToNormalized(const core::PixelPoint& pixel,
                                                   int frameWidth,
                                                   int frameHeight);

    core::ServoAngles normalizedToServo(const core::NormalizedPoint& point) const;
    core::NormalizedPoint servoToNormalized(const core::ServoAngles& angles) const;

    static double toAngle(double normalized, const core::AxisLimits& axis);
    static double toNormalized(double angle, const core::AxisLimits& axis);

    const core::ServoLimits& limits() const { return servoLimits; }

private:
    core::ServoLimits servoLimits;
};

} // namespace lasertrack::control
