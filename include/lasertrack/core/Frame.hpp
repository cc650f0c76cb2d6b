#pragma once

#include <opencv2/core.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace lasertrack::core {

/**
 * @brief Immutable snapshot of one camera frame.
 *
 * `image` is 8-bit BGR or single-channel grayscale. Frames are shared between
 * the capture loop and the session through `std::shared_ptr<const Frame>`, so
 * nothing downstream may write to the pixels.
 */
struct Frame {
    cv::Mat image;
    std::chrono::steady_clock::time_point timestamp{};
    std::uint64_t sequence = 0;

    int width() const { return image.cols; }
    int height() const { return image.rows; }
    bool empty() const { return image.empty(); }
};

using FramePtr = std::shared_ptr<const Frame>;

/**
 * @brief Single-slot mailbox with latest-value semantics.
 *
 * The producer overwrites the slot; consumers only ever see the most recent
 * frame and are told when nothing newer than what they already processed has
 * arrived. No queueing, no buffering.
 */
class FrameSlot {
public:
    /// Copy @p image into a new frame, stamp it and make it the latest value.
    std::uint64_t publish(const cv::Mat& image);

    /// Most recent frame, or null if nothing was published yet.
    FramePtr latest() const;

    /**
     * @brief Wait up to @p timeout for a frame newer than @p lastSequence.
     * @return The newest frame, or null if none newer arrived in time.
     */
    FramePtr waitForNewer(std::uint64_t lastSequence,
                          std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex;
    mutable std::condition_variable published;
    FramePtr current;
    std::uint64_t nextSequence = 1;
};

} // namespace lasertrack::core
