#pragma once

#include "lasertrack/core/Frame.hpp"
#include "lasertrack/core/Geometry.hpp"
#include "lasertrack/core/TargetingConfig.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <system_error>
#include <vector>

namespace lasertrack::vision {

struct DetectionResult {
    enum class Outcome {
        Found,
        NotFound,
        Ambiguous
    };

    Outcome outcome = Outcome::NotFound;
    double xPx = 0.0;
    double yPx = 0.0;
    double radius = 0.0;

    /// Working threshold of the last pass (the one that found the dot when Found).
    int threshold = 0;
    /// Number of threshold passes the search ran.
    int iterations = 0;
    /// The search stopped because the bounds collapsed or the pass cap was hit.
    bool boundsExhausted = false;

    bool found() const { return outcome == Outcome::Found; }
    core::PixelPoint pixel() const { return core::PixelPoint{xPx, yPx}; }

    /// Per-frame error code for a failed detection; empty when Found.
    std::error_code error() const;
};

const char* toString(DetectionResult::Outcome outcome);

/**
 * @brief Hough-circle search parameters for one frame width.
 *
 * The reference values are tuned for 640 px wide frames and scale linearly
 * with width so a dot of the same apparent size is found at any resolution.
 */
struct HoughParams {
    double minDistance = config::DETECTOR_MIN_CIRCLE_DISTANCE;
    int minRadius = config::DETECTOR_MIN_RADIUS;
    int maxRadius = config::DETECTOR_MAX_RADIUS;

    static HoughParams forWidth(int width);
};

/**
 * @brief Locates a single bright laser dot with an adaptive threshold search.
 *
 * Each pass keeps pixels of one channel above the working threshold
 * (threshold-to-zero), dilates them into solid blobs and counts circles with
 * a Hough pass. The threshold is bisected over [0, 255]: too many circles
 * raise it, none lowers it, exactly one ends the search. The number of passes
 * never exceeds `config::DETECTOR_MAX_ITERATIONS`, whatever the scene.
 *
 * The detector holds no per-frame state and may be shared between threads.
 */
class LaserDotDetector {
public:
    /**
     * @param frame Frame to search. Empty frames yield NotFound with zero iterations.
     * @param channel Channel to threshold. Ignored for single-channel frames.
     * @param thresholdHint Optional first pass, e.g. the last successful threshold.
     */
    DetectionResult detect(const core::Frame& frame,
                           core::Channel channel,
                           std::optional<int> thresholdHint = std::nullopt) const;

    /// Single-channel 8-bit plane the search runs on.
    static cv::Mat extractChannel(const cv::Mat& image, core::Channel channel);

private:
    static void findCircles(const cv::Mat& plane,
                            int threshold,
                            const HoughParams& params,
                            std::vector<cv::Vec3f>& circles);
};

} // namespace lasertrack::vision
