#include "lasertrack/session/SessionRunner.hpp"

#include "lasertrack/core/Errors.hpp"
#include "lasertrack/log/Log.hpp"

#include <exception>
#include <memory>
#include <utility>

namespace lasertrack::session {

SessionRunner::SessionRunner(actuator::ActuatorLink& actuatorLink,
                             const core::FrameSlot& frameSlot,
                             core::SessionConfig sessionConfig)
: link(actuatorLink)
, frames(frameSlot)
, config(std::move(sessionConfig)) {
    config.validate();
}

SessionRunner::~SessionRunner() {
    cancel();
    if (worker.joinable()) {
        worker.join();
    }
}

expected<void> SessionRunner::start(const TargetSpec& target) {
    // Held until the worker is launched so a concurrent cancel() lands either
    // before this session exists or on it, never in between.
    std::lock_guard control(controlMutex);
    if (running.exchange(true)) {
        logError("[SessionRunner] start rejected: a session is already running\n");
        return unexpected(errc::session_already_running);
    }

    // The previous worker has already cleared `running`; reap it.
    if (worker.joinable()) {
        worker.join();
    }

    std::unique_ptr<AcquisitionSession> session;
    try {
        session = std::make_unique<AcquisitionSession>(link, frames, config, target);
    } catch (const std::exception&) {
        running = false;
        throw;
    }

    cancelRequested = false;
    worker = std::thread([this, session = std::move(session)]() mutable {
        SessionResult result;
        try {
            result = session->run(cancelRequested);
        } catch (const std::exception& e) {
            result = session->abandon(e.what());
        }
        session.reset();

        {
            std::lock_guard lock(resultMutex);
            latest = result;
        }
        running = false;
    });
    return {};
}

void SessionRunner::cancel() {
    std::lock_guard control(controlMutex);
    if (running) {
        logInfo("[SessionRunner] cancel()\n");
    }
    cancelRequested = true;
}

std::optional<SessionResult> SessionRunner::wait() {
    if (worker.joinable()) {
        worker.join();
    }
    return lastResult();
}

std::optional<SessionResult> SessionRunner::lastResult() const {
    std::lock_guard lock(resultMutex);
    return latest;
}

} // namespace lasertrack::session
