#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace lasertrack::config {

// Detector, control-loop and session defaults. Pixel quantities are given at
// DETECTOR_REFERENCE_WIDTH and scaled to the actual frame width.

// Detector --------------------------------------------------------------------
constexpr int DETECTOR_THRESHOLD_MIN = 0;
constexpr int DETECTOR_THRESHOLD_MAX = 255;
constexpr int DETECTOR_MAX_ITERATIONS = 8;          // ceil(log2(256))
constexpr int DETECTOR_DILATE_ITERATIONS = 4;
constexpr int DETECTOR_REFERENCE_WIDTH = 640;       // radius band is tuned for this width
constexpr double DETECTOR_MIN_CIRCLE_DISTANCE = 50.0;
constexpr double DETECTOR_HOUGH_DP = 1.0;
constexpr double DETECTOR_HOUGH_CANNY = 50.0;       // param1
constexpr double DETECTOR_HOUGH_ACCUMULATOR = 2.0;  // param2
constexpr int DETECTOR_MIN_RADIUS = 3;
constexpr int DETECTOR_MAX_RADIUS = 16;
constexpr int DETECTOR_RADIUS_FLOOR = 2;

// Control loop ----------------------------------------------------------------
constexpr double PID_KP = 0.4;
constexpr double PID_KI = 1.5;  // per second
constexpr double PID_KD = 0.02;
constexpr std::chrono::milliseconds PID_SAMPLE_TIME{200};
constexpr double PID_MAX_STEP_DEG = 2.0;

// Session ---------------------------------------------------------------------
constexpr double SESSION_DEADBAND = 0.02;
constexpr std::chrono::milliseconds SESSION_MAX_DURATION{10000};
constexpr std::chrono::milliseconds SESSION_FRAME_WAIT{20};

} // namespace lasertrack::config

namespace lasertrack::core {

enum class Channel {
    Red,
    Green,
    Blue,
    Grayscale
};

const char* toString(Channel channel);

struct PidGains {
    double kp = config::PID_KP;
    double ki = config::PID_KI;
    double kd = config::PID_KD;
};

/**
 * @brief Runtime tuning for one acquisition session.
 *
 * Every field defaults from `lasertrack::config`. Call `validate()` after
 * changing values; it throws `std::invalid_argument` naming the bad field.
 */
struct SessionConfig {
    PidGains gains{};
    std::chrono::milliseconds sampleTime = config::PID_SAMPLE_TIME;
    double maxStepPerUpdate = config::PID_MAX_STEP_DEG;

    /// Detection channels in preference order.
    std::vector<Channel> channels{Channel::Red, Channel::Grayscale, Channel::Green};

    /// How long one iteration waits for a fresh frame before skipping detection.
    std::chrono::milliseconds frameWait = config::SESSION_FRAME_WAIT;

    void validate() const;
};

} // namespace lasertrack::core
