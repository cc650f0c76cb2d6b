#include "lasertrack/core/Frame.hpp"

namespace lasertrack::core {

std::uint64_t FrameSlot::publish(const cv::Mat& image) {
    auto frame = std::make_shared<Frame>();
    frame->image = image.clone();
    frame->timestamp = std::chrono::steady_clock::now();

    std::uint64_t sequence = 0;
    {
        std::lock_guard lock(mutex);
        sequence = nextSequence++;
        frame->sequence = sequence;
        current = std::move(frame);
    }
    published.notify_all();
    return sequence;
}

FramePtr FrameSlot::latest() const {
    std::lock_guard lock(mutex);
    return current;
}

FramePtr FrameSlot::waitForNewer(std::uint64_t lastSequence,
                                 std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex);
    const bool fresh = published.wait_for(lock, timeout, [&] {
        return current && current->sequence > lastSequence;
    });
    return fresh ? current : nullptr;
}

} // namespace lasertrack::core
