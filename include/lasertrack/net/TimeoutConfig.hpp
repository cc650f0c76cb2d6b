#pragma once

#include <atomic>
#include <chrono>

namespace lasertrack::net {

/**
 * @brief Pair of deadlines applied to one TCP peer: per-operation I/O and connect.
 *
 * `TimeoutConfig::defaults()` seeds every new `TcpClient`. The defaults are
 * process-wide and atomic, so a test may shorten them while a session thread
 * is running.
 */
struct TimeoutConfig {
    using duration = std::chrono::milliseconds;

    duration io{500};
    duration connect{1000};

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    TimeoutConfig sanitized() const {
        return TimeoutConfig{sanitize(io), sanitize(connect)};
    }

    static TimeoutConfig defaults() {
        return TimeoutConfig{duration{ioStorage().load()}, duration{connectStorage().load()}};
    }

    static void setDefaults(const TimeoutConfig& timeouts) {
        const auto clean = timeouts.sanitized();
        ioStorage().store(clean.io.count());
        connectStorage().store(clean.connect.count());
    }

    /// Swaps the defaults for the lifetime of the object.
    class ScopedOverride {
    public:
        explicit ScopedOverride(const TimeoutConfig& timeouts)
        : previousIo_(ioStorage().load())
        , previousConnect_(connectStorage().load()) {
            setDefaults(timeouts);
        }
        ~ScopedOverride() {
            ioStorage().store(previousIo_);
            connectStorage().store(previousConnect_);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

    private:
        duration::rep previousIo_;
        duration::rep previousConnect_;
    };

private:
    static std::atomic<duration::rep>& ioStorage() {
        static std::atomic<duration::rep> value{TimeoutConfig{}.io.count()};
        return value;
    }
    static std::atomic<duration::rep>& connectStorage() {
        static std::atomic<duration::rep> value{TimeoutConfig{}.connect.count()};
        return value;
    }
};

} // namespace lasertrack::net
