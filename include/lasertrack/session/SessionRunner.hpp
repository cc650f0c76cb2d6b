#pragma once

#include "lasertrack/actuator/ActuatorLink.hpp"
#include "lasertrack/core/Expected.hpp"
#include "lasertrack/core/Frame.hpp"
#include "lasertrack/core/TargetingConfig.hpp"
#include "lasertrack/session/AcquisitionSession.hpp"
#include "lasertrack/session/TargetSpec.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace lasertrack::session {

/**
 * @brief Runs acquisition sessions on a background thread, one at a time.
 *
 * The frame-producing loop keeps publishing into the `FrameSlot` while the
 * session thread consumes it; neither ever waits on the other.
 *
 * Threading model:
 * - `start()` spawns the worker that owns the session until it is terminal.
 * - `cancel()` raises an atomic flag the session checks once per iteration,
 *   so cancellation takes effect within one detection + control cycle.
 * - `wait()` joins the worker and hands back the terminal `SessionResult`.
 *
 * `start()` and `wait()` belong to the owning thread; `cancel()`,
 * `isRunning()` and `lastResult()` may be called from anywhere.
 */
class SessionRunner {
public:
    SessionRunner(actuator::ActuatorLink& link,
                  const core::FrameSlot& frames,
                  core::SessionConfig config = {});
    ~SessionRunner();

    SessionRunner(const SessionRunner&) = delete;
    SessionRunner& operator=(const SessionRunner&) = delete;

    /**
     * @brief Begin a session toward @p target.
     * @return `errc::session_already_running` while another session is active.
     *
     * Throws `std::invalid_argument` for an invalid target or configuration.
     */
    expected<void> start(const TargetSpec& target);

    /// Ask the running session to stop. It ends Aborted with the laser off.
    void cancel();

    /// Block until the current session (if any) is over and return its result.
    std::optional<SessionResult> wait();

    bool isRunning() const { return running.load(); }
    std::optional<SessionResult> lastResult() const;

private:
    actuator::ActuatorLink& link;
    const core::FrameSlot& frames;
    core::SessionConfig config;

    std::mutex controlMutex;
    std::thread worker;
    std::atomic<bool> running{false};
    std::atomic<bool> cancelRequested{false};

    mutable std::mutex resultMutex;
    std::optional<SessionResult> latest;
};

} // namespace lasertrack::session
