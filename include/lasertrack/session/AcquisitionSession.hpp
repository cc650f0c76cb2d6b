#pragma once

#include "lasertrack/actuator/ActuatorLink.hpp"
#include "lasertrack/control/AxisPidController.hpp"
#include "lasertrack/control/CoordinateNormalizer.hpp"
#include "lasertrack/core/Frame.hpp"
#include "lasertrack/core/Geometry.hpp"
#include "lasertrack/core/TargetingConfig.hpp"
#include "lasertrack/session/TargetSpec.hpp"
#include "lasertrack/vision/LaserFinder.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace lasertrack::session {

enum class SessionStatus {
    Running,
    Converged,
    TimedOut,
    Aborted,
    ActuatorUnreachable
};

const char* toString(SessionStatus status);

/// Session-level error code for a terminal status; empty for Converged and Running.
std::error_code toErrorCode(SessionStatus status);

enum class SessionPhase {
    Idle,
    Enabling,
    Searching,
    Correcting,
    Converged,
    TimedOut,
    Aborted,
    ActuatorUnreachable
};

const char* toString(SessionPhase phase);

/**
 * @brief What the caller learns once a session is over.
 *
 * `finalError` is the normalized distance between dot and target at the last
 * successful detection, absent when the dot was never seen.
 */
struct SessionResult {
    SessionStatus status = SessionStatus::Running;
    std::optional<double> finalError{};

    std::size_t actuatorWrites = 0;       // angle commands acknowledged by the controller
    std::size_t detectionFailures = 0;    // frames in which the dot was not found
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief One bounded attempt at putting the laser dot on a target.
 *
 * Drives Idle -> Enabling -> Searching <-> Correcting until one of the
 * terminal phases (Converged, TimedOut, Aborted, ActuatorUnreachable).
 * Each `step()` is one cooperative iteration: the cancel flag and the
 * deadline are checked once, at most one frame is examined and at most one
 * angle pair is written.
 *
 * The session exclusively owns both axis loops and the laser-enable flag.
 * Every terminal transition goes through a single exit routine which turns
 * the laser off when this session turned it on. A session destroyed before
 * reaching a terminal phase does the same.
 *
 * Not thread-safe; one thread drives it from start to finish.
 */
class AcquisitionSession {
public:
    AcquisitionSession(actuator::ActuatorLink& link,
                       const core::FrameSlot& frames,
                       core::SessionConfig config,
                       TargetSpec target);
    ~AcquisitionSession();

    AcquisitionSession(const AcquisitionSession&) = delete;
    AcquisitionSession& operator=(const AcquisitionSession&) = delete;

    /// Run one iteration. A no-op once the session is terminal.
    SessionStatus step(const std::atomic<bool>& cancel);

    /// Step until terminal and return the outcome.
    SessionResult run(const std::atomic<bool>& cancel);

    /// Force the session to Aborted (laser off) when it cannot be driven further.
    SessionResult abandon(std::string_view reason);

    SessionStatus status() const;
    SessionPhase phase() const { return currentPhase; }
    bool isTerminal() const;
    SessionResult result() const;

    bool laserEnabled() const { return laserOn; }
    std::size_t consecutiveDetectionFailures() const { return consecutiveFailures; }

    /// Last commanded position mapped back to normalized coordinates.
    std::optional<core::NormalizedPoint> commandedPosition() const;

    /// Dot position at the last successful detection.
    std::optional<core::NormalizedPoint> observedPosition() const { return lastObserved; }

    const TargetSpec& target() const { return targetSpec; }

private:
    using Clock = control::Clock;

    void enter();
    void enableLaser();
    void search();
    void correct(Clock::time_point now);

    void finish(SessionPhase terminal);

    actuator::ActuatorLink& link;
    const core::FrameSlot& frames;
    core::SessionConfig sessionConfig;
    TargetSpec targetSpec;

    vision::LaserFinder finder;
    std::optional<control::CoordinateNormalizer> normalizer;
    std::optional<control::AxisPidController> horizontalPid;
    std::optional<control::AxisPidController> verticalPid;
    control::PidState horizontalState{};
    control::PidState verticalState{};

    SessionPhase currentPhase = SessionPhase::Idle;
    std::optional<Clock::time_point> startTime{};
    std::optional<Clock::time_point> endTime{};
    std::uint64_t lastFrameSequence = 0;

    bool laserOn = false;
    std::size_t consecutiveFailures = 0;
    std::size_t totalFailures = 0;
    std::size_t angleWrites = 0;

    std::optional<core::NormalizedPoint> lastObserved{};
    std::optional<double> lastError{};
    std::optional<core::ServoAngles> commanded{};
};

} // namespace lasertrack::session
