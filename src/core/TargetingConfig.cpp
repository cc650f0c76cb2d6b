#include "lasertrack/core/TargetingConfig.hpp"

#include <cmath>
#include <stdexcept>

namespace lasertrack::core {

const char* toString(Channel channel) {
    switch (channel) {
        case Channel::Red:       return "red";
        case Channel::Green:     return "green";
        case Channel::Blue:      return "blue";
        case Channel::Grayscale: return "grayscale";
    }
    return "unknown";
}

void SessionConfig::validate() const {
    if (!std::isfinite(gains.kp) || !std::isfinite(gains.ki) || !std::isfinite(gains.kd)) {
        throw std::invalid_argument("SessionConfig: PID gains must be finite");
    }
    if (sampleTime.count() <= 0) {
        throw std::invalid_argument("SessionConfig: sampleTime must be positive");
    }
    if (!(maxStepPerUpdate > 0.0)) {
        throw std::invalid_argument("SessionConfig: maxStepPerUpdate must be positive");
    }
    if (channels.empty()) {
        throw std::invalid_argument("SessionConfig: at least one detection channel is required");
    }
    if (frameWait.count() < 0) {
        throw std::invalid_argument("SessionConfig: frameWait must not be negative");
    }
}

} // namespace lasertrack::core
