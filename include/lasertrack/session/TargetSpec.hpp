#pragma once

#include "lasertrack/core/Geometry.hpp"
#include "lasertrack/core/TargetingConfig.hpp"

#include <chrono>

namespace lasertrack::session {

/**
 * @brief Where one session should put the dot, how close is close enough, and for how long to try.
 */
struct TargetSpec {
    core::NormalizedPoint target{0.5, 0.5};
    double deadbandRadius = config::SESSION_DEADBAND;
    std::chrono::milliseconds maxDuration = config::SESSION_MAX_DURATION;

    /**
     * @brief Aim at a subject's image-space bounding box.
     *
     * The target is the horizontal centre of the box, a third of the way down
     * from its top edge, normalized by the size of the frame the box came from.
     * Throws `std::invalid_argument` for an empty frame size.
     */
    static TargetSpec fromBoundingBox(double x, double y, double width, double height,
                                      int frameWidth, int frameHeight,
                                      double deadbandRadius = config::SESSION_DEADBAND,
                                      std::chrono::milliseconds maxDuration = config::SESSION_MAX_DURATION);

    void validate() const;
};

} // namespace lasertrack::session
