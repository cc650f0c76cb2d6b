#pragma once
#include "lasertrack/net/NetConfig.hpp"
#include "lasertrack/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace lasertrack::net {

namespace detail {

// Outcome shared by the operation handler, the timer handler and the blocked
// caller. Whichever handler settles first wins; the other becomes a no-op.
struct DeadlineState {
    std::mutex mutex;
    std::condition_variable settled;
    bool done = false;
    error_code result = asio::error::would_block;

    // Runs beforeWake() between recording the result and waking the caller.
    template<typename BeforeWake>
    bool settle(const error_code& ec, BeforeWake beforeWake) {
        {
            std::lock_guard lock(mutex);
            if (done) {
                return false;
            }
            result = ec;
            done = true;
        }
        beforeWake();
        settled.notify_one();
        return true;
    }

    error_code wait() {
        std::unique_lock lock(mutex);
        settled.wait(lock, [this] { return done; });
        return result;
    }
};

} // namespace detail

/**
 * @brief Blocks the calling thread on one async operation, bounded by @p timeout.
 *
 * `start_async(handler)` must launch exactly one operation that eventually
 * calls `handler(ec, ...)`. If the timer expires first, `cancel()` is invoked
 * to abort the operation and `asio::error::timed_out` is returned.
 *
 * Both handlers hold the shared state, so a late completion after this
 * function returned is harmless. The executor's io_context must be running on
 * another thread (see NetService); calling this from an I/O handler deadlocks.
 */
template<typename StartAsync, typename Cancel>
error_code with_deadline(asio::any_io_executor ex,
                         std::chrono::milliseconds timeout,
                         StartAsync start_async,
                         Cancel cancel)
{
    auto state = std::make_shared<detail::DeadlineState>();
    auto timer = std::make_shared<asio::steady_timer>(ex, timeout);

    start_async([state, timer](const error_code& ec, auto&&...) {
        state->settle(ec, [&timer] { timer->cancel(); });
    });

    timer->async_wait([state, timer, cancel, timeout](const error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        state->settle(asio::error::timed_out, [&] {
            logError("[Deadline] no completion within ", timeout.count(), "ms, cancelling\n");
            cancel();
        });
    });

    return state->wait();
}

} // namespace lasertrack::net
