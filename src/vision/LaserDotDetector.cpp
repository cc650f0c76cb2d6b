#include "lasertrack/vision/LaserDotDetector.hpp"

#include "lasertrack/core/Errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace lasertrack::vision {

const char* toString(DetectionResult::Outcome outcome) {
    switch (outcome) {
        case DetectionResult::Outcome::Found:     return "found";
        case DetectionResult::Outcome::NotFound:  return "not-found";
        case DetectionResult::Outcome::Ambiguous: return "ambiguous";
    }
    return "unknown";
}

std::error_code DetectionResult::error() const {
    switch (outcome) {
        case Outcome::Found:
            return {};
        case Outcome::Ambiguous:
            return make_error_code(errc::detection_ambiguous);
        case Outcome::NotFound:
            break;
    }
    return make_error_code(boundsExhausted ? errc::search_bounds_exhausted
                                           : errc::detection_not_found);
}

HoughParams HoughParams::forWidth(int width) {
    const double scale = width > 0
        ? static_cast<double>(width) / config::DETECTOR_REFERENCE_WIDTH
        : 1.0;

    HoughParams params;
    params.minDistance = config::DETECTOR_MIN_CIRCLE_DISTANCE * scale;
    params.minRadius = std::max(config::DETECTOR_RADIUS_FLOOR,
                                static_cast<int>(std::lround(config::DETECTOR_MIN_RADIUS * scale)));
    params.maxRadius = std::max(params.minRadius + 1,
                                static_cast<int>(std::lround(config::DETECTOR_MAX_RADIUS * scale)));
    return params;
}

cv::Mat LaserDotDetector::extractChannel(const cv::Mat& image, core::Channel channel) {
    if (image.channels() == 1) {
        return image;
    }

    cv::Mat plane;
    switch (channel) {
        case core::Channel::Blue:
            cv::extractChannel(image, plane, 0);
            break;
        case core::Channel::Green:
            cv::extractChannel(image, plane, 1);
            break;
        case core::Channel::Red:
            cv::extractChannel(image, plane, 2);
            break;
        case core::Channel::Grayscale: {
            cv::Mat gray;
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            cv::normalize(gray, plane, 0, 255, cv::NORM_MINMAX);
            break;
        }
    }
    return plane;
}

void LaserDotDetector::findCircles(const cv::Mat& plane,
                                   int threshold,
                                   const HoughParams& params,
                                   std::vector<cv::Vec3f>& circles) {
    circles.clear();

    cv::Mat bright;
    cv::threshold(plane, bright, threshold, 255, cv::THRESH_TOZERO);
    if (cv::countNonZero(bright) == 0) {
        return;
    }

    // Merge the speckled core of the dot into one solid blob.
    cv::Mat blobs;
    cv::dilate(bright, blobs, cv::Mat(), cv::Point(-1, -1), config::DETECTOR_DILATE_ITERATIONS);

    cv::HoughCircles(blobs, circles, cv::HOUGH_GRADIENT,
                     config::DETECTOR_HOUGH_DP,
                     params.minDistance,
                     config::DETECTOR_HOUGH_CANNY,
                     config::DETECTOR_HOUGH_ACCUMULATOR,
                     params.minRadius,
                     params.maxRadius);
}

DetectionResult LaserDotDetector::detect(const core::Frame& frame,
                                         core::Channel channel,
                                         std::optional<int> thresholdHint) const {
    DetectionResult result;
    if (frame.empty()) {
        return result;
    }

    const cv::Mat plane = extractChannel(frame.image, channel);
    const HoughParams params = HoughParams::forWidth(frame.width());

    int lo = config::DETECTOR_THRESHOLD_MIN;
    int hi = config::DETECTOR_THRESHOLD_MAX;
    bool lastSawSeveral = false;
    std::vector<cv::Vec3f> circles;

    while (lo <= hi && result.iterations < config::DETECTOR_MAX_ITERATIONS) {
        int threshold = lo + (hi - lo) / 2;
        if (result.iterations == 0 && thresholdHint && *thresholdHint >= lo && *thresholdHint <= hi) {
            threshold = *thresholdHint;
        }

        ++result.iterations;
        result.threshold = threshold;
        findCircles(plane, threshold, params, circles);

        if (circles.size() == 1) {
            result.outcome = DetectionResult::Outcome::Found;
            result.xPx = circles.front()[0];
            result.yPx = circles.front()[1];
            result.radius = circles.front()[2];
            return result;
        }

        // The dot is the brightest thing in view: several candidates means the
        // threshold still lets background through, none means it cut the dot.
        lastSawSeveral = circles.size() > 1;
        if (lastSawSeveral) {
            lo = threshold + 1;
        } else {
            hi = threshold - 1;
        }
    }

    result.boundsExhausted = true;
    result.outcome = lastSawSeveral ? DetectionResult::Outcome::Ambiguous
                                    : DetectionResult::Outcome::NotFound;
    return result;
}

} // namespace lasertrack::vision
