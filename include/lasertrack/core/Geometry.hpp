#pragma once

#include <algorithm>
#include <cmath>

namespace lasertrack::core {

// Position as a fraction of frame width/height. Consumers clamp with
// `clamped()` before any further computation.
struct NormalizedPoint {
    double x = 0.0;
    double y = 0.0;

    NormalizedPoint clamped() const {
        return NormalizedPoint{std::clamp(x, 0.0, 1.0), std::clamp(y, 0.0, 1.0)};
    }
};

inline double distance(const NormalizedPoint& a, const NormalizedPoint& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

struct AxisLimits {
    double min = 0.0;
    double max = 0.0;

    double range() const { return max - min; }
    double midpoint() const { return min + range() / 2.0; }
    double clamp(double angle) const {
        return std::clamp(angle, std::min(min, max), std::max(min, max));
    }
};

/// Physical angle limits of both axes, in degrees, as reported by the actuator.
struct ServoLimits {
    AxisLimits horizontal{};
    AxisLimits vertical{};
};

/// Angle pair in degrees. Always within the session's `ServoLimits`.
struct ServoAngles {
    double h = 0.0;
    double v = 0.0;
};

} // namespace lasertrack::core
