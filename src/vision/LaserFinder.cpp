#include "lasertrack/vision/LaserFinder.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lasertrack::vision {

LaserFinder::LaserFinder(std::vector<core::Channel> channelOrder)
: channels(std::move(channelOrder)) {
    if (channels.empty()) {
        throw std::invalid_argument("LaserFinder: at least one channel is required");
    }
}

void LaserFinder::reset() {
    lastChannel.reset();
    lastThreshold.reset();
}

std::vector<core::Channel> LaserFinder::orderedChannels() const {
    std::vector<core::Channel> order = channels;
    if (lastChannel) {
        auto it = std::find(order.begin(), order.end(), *lastChannel);
        if (it != order.end()) {
            std::rotate(order.begin(), it, it + 1);
        }
    }
    return order;
}

DetectionResult LaserFinder::find(const core::Frame& frame) {
    DetectionResult result;
    for (const auto channel : orderedChannels()) {
        std::optional<int> hint;
        if (lastChannel && *lastChannel == channel) {
            hint = lastThreshold;
        }
        result = detector.detect(frame, channel, hint);
        if (result.found()) {
            lastChannel = channel;
            lastThreshold = result.threshold;
            return result;
        }
    }

    reset();
    return result;
}

} // namespace lasertrack::vision
