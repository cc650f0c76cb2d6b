#include "lasertrack/control/CoordinateNormalizer.hpp"

#include <algorithm>

namespace lasertrack::control {

CoordinateNormalizer::CoordinateNormalizer(const core::ServoLimits& limits)
: servoLimits(limits) {}

core::NormalizedPoint CoordinateNormalizer::pixelToNormalized(const core::PixelPoint& pixel,
                                                              int frameWidth,
                                                              int frameHeight) {
    const double x = frameWidth > 0 ? pixel.x / static_cast<double>(frameWidth) : 0.0;
    const double y = frameHeight > 0 ? pixel.y / static_cast<double>(frameHeight) : 0.0;
    return core::NormalizedPoint{x, y}.clamped();
}

double CoordinateNormalizer::toAngle(double normalized, const core::AxisLimits& axis) {
    return axis.min + std::clamp(normalized, 0.0, 1.0) * axis.range();
}

double CoordinateNormalizer::toNormalized(double angle, const core::AxisLimits& axis) {
    const double range = axis.range();
    if (range == 0.0) {
        return 0.0;
    }
    return std::clamp((angle - axis.min) / range, 0.0, 1.0);
}

core::ServoAngles CoordinateNormalizer::normalizedToServo(const core::NormalizedPoint& point) const {
    return core::ServoAngles{toAngle(point.x, servoLimits.horizontal),
                             toAngle(point.y, servoLimits.vertical)};
}

core::NormalizedPoint CoordinateNormalizer::servoToNormalized(const core::ServoAngles& angles) const {
    return core::NormalizedPoint{toNormalized(angles.h, servoLimits.horizontal),
                                 toNormalized(angles.v, servoLimits.vertical)};
}

} // namespace lasertrack::control
