#include "lasertrack/session/TargetSpec.hpp"

#include "lasertrack/control/CoordinateNormalizer.hpp"

#include <stdexcept>

namespace lasertrack::session {

TargetSpec TargetSpec::fromBoundingBox(double x, double y, double width, double height,
                                       int frameWidth, int frameHeight,
                                       double deadbandRadius,
                                       std::chrono::milliseconds maxDuration) {
    if (frameWidth <= 0 || frameHeight <= 0) {
        throw std::invalid_argument("TargetSpec: frame size must be positive");
    }

    const core::PixelPoint aim{x + width / 2.0, y + height / 3.0};

    TargetSpec out;
    out.target = control::CoordinateNormalizer::pixelToNormalized(aim, frameWidth, frameHeight);
    out.deadbandRadius = deadbandRadius;
    out.maxDuration = maxDuration;
    out.validate();
    return out;
}

void TargetSpec::validate() const {
    if (!(deadbandRadius >= 0.0)) {
        throw std::invalid_argument("TargetSpec: deadbandRadius must be >= 0");
    }
    if (maxDuration.count() <= 0) {
        throw std::invalid_argument("TargetSpec: maxDuration must be positive");
    }
}

} // namespace lasertrack::session
