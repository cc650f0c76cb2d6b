#include "lasertrack/session/AcquisitionSession.hpp"

#include "lasertrack/core/Errors.hpp"
#include "lasertrack/log/Log.hpp"

#include <string>
#include <utility>

namespace lasertrack::session {

namespace {

bool isTerminalPhase(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Converged:
        case SessionPhase::TimedOut:
        case SessionPhase::Aborted:
        case SessionPhase::ActuatorUnreachable:
            return true;
        default:
            return false;
    }
}

} // namespace

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Running:             return "running";
        case SessionStatus::Converged:           return "converged";
        case SessionStatus::TimedOut:            return "timed-out";
        case SessionStatus::Aborted:             return "aborted";
        case SessionStatus::ActuatorUnreachable: return "actuator-unreachable";
    }
    return "unknown";
}

std::error_code toErrorCode(SessionStatus status) {
    switch (status) {
        case SessionStatus::TimedOut:            return make_error_code(errc::session_timed_out);
        case SessionStatus::Aborted:             return make_error_code(errc::session_aborted);
        case SessionStatus::ActuatorUnreachable: return make_error_code(errc::actuator_unreachable);
        default:                                 return {};
    }
}

const char* toString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle:                return "idle";
        case SessionPhase::Enabling:            return "enabling";
        case SessionPhase::Searching:           return "searching";
        case SessionPhase::Correcting:          return "correcting";
        case SessionPhase::Converged:           return "converged";
        case SessionPhase::TimedOut:            return "timed-out";
        case SessionPhase::Aborted:             return "aborted";
        case SessionPhase::ActuatorUnreachable: return "actuator-unreachable";
    }
    return "unknown";
}

AcquisitionSession::AcquisitionSession(actuator::ActuatorLink& actuatorLink,
                                       const core::FrameSlot& frameSlot,
                                       core::SessionConfig config,
                                       TargetSpec target)
: link(actuatorLink)
, frames(frameSlot)
, sessionConfig(std::move(config))
, targetSpec(target)
, finder(sessionConfig.channels) {
    sessionConfig.validate();
    targetSpec.validate();
    targetSpec.target = targetSpec.target.clamped();
}

AcquisitionSession::~AcquisitionSession() {
    if (laserOn) {
        logError("[AcquisitionSession] destroyed in phase ", toString(currentPhase),
                 " with the laser on, switching it off\n");
        if (auto rc = link.forceLaserOff(); !rc) {
            logError("[AcquisitionSession] laser off failed: ", rc.error().message(), "\n");
        }
        laserOn = false;
    }
}

bool AcquisitionSession::isTerminal() const {
    return isTerminalPhase(currentPhase);
}

SessionStatus AcquisitionSession::status() const {
    switch (currentPhase) {
        case SessionPhase::Converged:           return SessionStatus::Converged;
        case SessionPhase::TimedOut:            return SessionStatus::TimedOut;
        case SessionPhase::Aborted:             return SessionStatus::Aborted;
        case SessionPhase::ActuatorUnreachable: return SessionStatus::ActuatorUnreachable;
        default:                                return SessionStatus::Running;
    }
}

SessionResult AcquisitionSession::result() const {
    SessionResult out;
    out.status = status();
    out.finalError = lastError;
    out.actuatorWrites = angleWrites;
    out.detectionFailures = totalFailures;
    if (startTime) {
        const auto end = endTime ? *endTime : Clock::now();
        out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - *startTime);
    }
    return out;
}

std::optional<core::NormalizedPoint> AcquisitionSession::commandedPosition() const {
    if (!commanded || !normalizer) {
        return std::nullopt;
    }
    return normalizer->servoToNormalized(*commanded);
}

SessionStatus AcquisitionSession::step(const std::atomic<bool>& cancel) {
    if (isTerminal()) {
        return status();
    }

    if (cancel.load()) {
        logInfo("[AcquisitionSession] cancelled in phase ", toString(currentPhase), "\n");
        finish(SessionPhase::Aborted);
        return status();
    }

    const auto now = Clock::now();
    if (startTime && now - *startTime > targetSpec.maxDuration) {
        finish(SessionPhase::TimedOut);
        return status();
    }

    switch (currentPhase) {
        case SessionPhase::Idle:
            enter();
            break;
        case SessionPhase::Enabling:
            enableLaser();
            break;
        case SessionPhase::Searching:
            search();
            if (currentPhase == SessionPhase::Correcting) {
                correct(now);
            }
            break;
        case SessionPhase::Correcting:
            correct(now);
            break;
        default:
            break;
    }
    return status();
}

SessionResult AcquisitionSession::run(const std::atomic<bool>& cancel) {
    while (step(cancel) == SessionStatus::Running) {
    }
    return result();
}

SessionResult AcquisitionSession::abandon(std::string_view reason) {
    if (!isTerminal()) {
        logError("[AcquisitionSession] abandoned: ", reason, "\n");
        finish(SessionPhase::Aborted);
    }
    return result();
}

// Idle -> Enabling: limits are queried before anything else so a dead
// controller never sees an "on".
void AcquisitionSession::enter() {
    startTime = Clock::now();
    link.beginSession(sessionConfig.sampleTime);

    auto limits = link.queryLimits();
    if (!limits) {
        logError("[AcquisitionSession] ", make_error_code(errc::limits_unavailable).message(),
                 ": ", limits.error().message(), "\n");
        finish(SessionPhase::ActuatorUnreachable);
        return;
    }

    normalizer.emplace(*limits);
    horizontalPid.emplace("horizontal", limits->horizontal, sessionConfig.gains,
                          sessionConfig.sampleTime, sessionConfig.maxStepPerUpdate);
    verticalPid.emplace("vertical", limits->vertical, sessionConfig.gains,
                        sessionConfig.sampleTime, sessionConfig.maxStepPerUpdate);
    horizontalState = horizontalPid->initialState();
    verticalState = verticalPid->initialState();
    finder.reset();

    logInfo("[AcquisitionSession] limits h=[", limits->horizontal.min, ",", limits->horizontal.max,
            "] v=[", limits->vertical.min, ",", limits->vertical.max,
            "] target=(", targetSpec.target.x, ",", targetSpec.target.y, ")\n");
    currentPhase = SessionPhase::Enabling;
}

void AcquisitionSession::enableLaser() {
    // Once "on" is on the wire the controller may have acted on it, whatever
    // the reply, so the exit routine must send "off".
    laserOn = true;
    if (auto rc = link.setLaser(true); !rc) {
        logError("[AcquisitionSession] laser on failed: ", rc.error().message(), "\n");
        finish(SessionPhase::ActuatorUnreachable);
        return;
    }
    currentPhase = SessionPhase::Searching;
}

void AcquisitionSession::search() {
    auto frame = frames.waitForNewer(lastFrameSequence, sessionConfig.frameWait);
    if (!frame) {
        return; // nothing new; never reprocess a stale frame
    }
    lastFrameSequence = frame->sequence;

    const auto detection = finder.find(*frame);
    if (!detection.found()) {
        ++totalFailures;
        if (++consecutiveFailures == 1) {
            logInfo("[AcquisitionSession] frame ", frame->sequence, ": ",
                    detection.error().message(), "\n");
        }
        return;
    }

    consecutiveFailures = 0;
    lastObserved = control::CoordinateNormalizer::pixelToNormalized(
        detection.pixel(), frame->width(), frame->height());
    lastError = core::distance(targetSpec.target, *lastObserved);
    logDebug("[AcquisitionSession] frame ", frame->sequence, ": dot at (", lastObserved->x, ",",
             lastObserved->y, ") error=", *lastError, " threshold=", detection.threshold, "\n");
    currentPhase = SessionPhase::Correcting;
}

void AcquisitionSession::correct(Clock::time_point now) {
    const auto current = lastObserved->clamped();
    if (*lastError < targetSpec.deadbandRadius) {
        finish(SessionPhase::Converged);
        return;
    }
    currentPhase = SessionPhase::Searching;

    const double errorH = horizontalPid->angleScaledError(targetSpec.target.x, current.x);
    const double errorV = verticalPid->angleScaledError(targetSpec.target.y, current.y);
    const auto outH = horizontalPid->update(horizontalState, errorH, now);
    const auto outV = verticalPid->update(verticalState, errorV, now);
    if (!outH && !outV) {
        return; // within the sample interval
    }

    const core::ServoAngles angles{
        horizontalPid->limits().clamp(outH.value_or(horizontalState.previousOutput)),
        verticalPid->limits().clamp(outV.value_or(verticalState.previousOutput))};

    if (auto rc = link.setAngles(angles); !rc) {
        if (rc.error() == errc::command_rejected) {
            logError("[AcquisitionSession] controller rejected (", angles.h, ",", angles.v, ")\n");
            return;
        }
        logError("[AcquisitionSession] angle write failed: ", rc.error().message(), "\n");
        finish(SessionPhase::ActuatorUnreachable);
        return;
    }
    ++angleWrites;
    commanded = angles;
    logDebug("[AcquisitionSession] commanded (", angles.h, ",", angles.v, ")\n");
}

void AcquisitionSession::finish(SessionPhase terminal) {
    if (laserOn) {
        if (auto rc = link.forceLaserOff(); !rc) {
            logError("[AcquisitionSession] laser off failed: ", rc.error().message(), "\n");
        }
        laserOn = false;
    }
    currentPhase = terminal;
    endTime = Clock::now();
    if (!startTime) {
        startTime = endTime;
    }

    const auto summary = result();
    logInfo("[AcquisitionSession] ", toString(summary.status),
            " after ", summary.elapsed.count(), "ms, writes=", summary.actuatorWrites,
            " detection failures=", summary.detectionFailures,
            " error=", summary.finalError ? std::to_string(*summary.finalError) : std::string("n/a"),
            "\n");
}

} // namespace lasertrack::session
