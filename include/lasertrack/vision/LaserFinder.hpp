#pragma once

#include "lasertrack/vision/LaserDotDetector.hpp"

#include <optional>
#include <vector>

namespace lasertrack::vision {

/**
 * @brief Runs the dot detector over several channels, remembering what worked.
 *
 * Channels are tried in the configured order, except that the channel which
 * last found the dot goes first. The threshold that last found the dot seeds
 * the first pass of the next search, so a steady scene usually resolves in a
 * single pass. A frame where no channel finds the dot clears both hints.
 *
 * Owned by one session; not thread-safe.
 */
class LaserFinder {
public:
    explicit LaserFinder(std::vector<core::Channel> channels);

    /// Result of the first channel that found the dot, or of the last channel tried.
    DetectionResult find(const core::Frame& frame);

    std::optional<core::Channel> winningChannel() const { return lastChannel; }
    std::optional<int> winningThreshold() const { return lastThreshold; }

    void reset();

private:
    std::vector<core::Channel> orderedChannels() const;

    LaserDotDetector detector;
    std::vector<core::Channel> channels;
    std::optional<core::Channel> lastChannel;
    std::optional<int> lastThreshold;
};

} // namespace lasertrack::vision
