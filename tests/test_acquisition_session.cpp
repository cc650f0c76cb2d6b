#include "lasertrack/core/Errors.hpp"
#include "lasertrack/core/Frame.hpp"
#include "lasertrack/log/Log.hpp"
#include "lasertrack/session/AcquisitionSession.hpp"
#include "lasertrack/session/TargetSpec.hpp"

#include "FakeActuatorLink.hpp"
#include "SyntheticFrames.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

using namespace lasertrack;
using namespace std::chrono_literals;
using lasertrack::session::AcquisitionSession;
using lasertrack::session::SessionPhase;
using lasertrack::session::SessionStatus;
using lasertrack::session::TargetSpec;
using lasertrack::testing::FakeActuatorLink;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lasertrack::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lasertrack::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static core::SessionConfig fastConfig() {
    core::SessionConfig config;
    config.sampleTime = 20ms;
    config.frameWait = 5ms;
    return config;
}

static TargetSpec centreTarget(std::chrono::milliseconds maxDuration = 2000ms) {
    TargetSpec target;
    target.target = {0.5, 0.5};
    target.deadbandRadius = 0.02;
    target.maxDuration = maxDuration;
    return target;
}

// Limits query fails: the session ends before the laser is ever enabled.
static void testLimitsFailure() {
    FakeActuatorLink link;
    link.failLimitsQuery(true);
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget());
    const auto result = session.run(cancel);

    ASSERT_TRUE(result.status == SessionStatus::ActuatorUnreachable, "status is ActuatorUnreachable");
    ASSERT_EQ(link.laserOnCommands(), 0, "laser never enabled");
    ASSERT_EQ(link.laserOffCommands(), 0, "nothing to disable");
    ASSERT_EQ(link.angleWrites().size(), std::size_t{0}, "no angle writes");
    ASSERT_TRUE(!result.finalError, "dot never seen");
    ASSERT_TRUE(lasertrack::session::toErrorCode(result.status) == errc::actuator_unreachable, "error code mapping");
}

// Dot already on target: Converged with zero angle writes, laser back off.
static void testAlreadyInsideDeadband() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    frames.publish(testing::frameWithDots({{320, 240}}));
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget());
    const auto result = session.run(cancel);

    ASSERT_TRUE(result.status == SessionStatus::Converged, "status is Converged");
    ASSERT_EQ(link.angleWrites().size(), std::size_t{0}, "zero actuator writes");
    ASSERT_EQ(result.actuatorWrites, std::size_t{0}, "result reports zero writes");
    ASSERT_EQ(link.laserOnCommands(), 1, "laser enabled once");
    ASSERT_EQ(link.laserOffCommands(), 1, "laser disabled on exit");
    ASSERT_TRUE(!link.laserOn(), "laser left off");
    ASSERT_TRUE(result.finalError && *result.finalError < 0.02, "final error inside deadband");
    const auto observed = session.observedPosition();
    ASSERT_TRUE(observed && std::fabs(observed->x - 0.5) < 0.01 && std::fabs(observed->y - 0.5) < 0.01,
                "observed dot at the frame centre");
    ASSERT_TRUE(!session.commandedPosition(), "nothing commanded");
    ASSERT_TRUE(link.commandInterval() == 20ms, "link throttled to the sample time");

    // Converged is terminal: further steps never touch the actuator.
    frames.publish(testing::frameWithDots({{100, 100}}));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(session.step(cancel) == SessionStatus::Converged, "stays Converged");
    }
    ASSERT_EQ(link.angleWrites().size(), std::size_t{0}, "no writes after convergence");
    ASSERT_EQ(link.laserOffCommands(), 1, "no extra laser commands after convergence");
    ASSERT_EQ(link.laserOnCommands(), 1, "laser not re-enabled after convergence");
}

// No dot ever found: TimedOut, laser disabled with at least one "off".
static void testDetectionNeverSucceeds() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};
    std::atomic<bool> producing{true};

    std::thread producer([&] {
        while (producing) {
            frames.publish(testing::blankFrame());
            std::this_thread::sleep_for(10ms);
        }
    });

    AcquisitionSession session(link, frames, fastConfig(), centreTarget(300ms));
    const auto result = session.run(cancel);
    producing = false;
    producer.join();

    ASSERT_TRUE(result.status == SessionStatus::TimedOut, "status is TimedOut");
    ASSERT_TRUE(link.laserOffCommands() >= 1, "laser off issued");
    ASSERT_TRUE(!link.laserOn(), "laser left off");
    ASSERT_TRUE(result.detectionFailures >= 1, "failures counted");
    ASSERT_TRUE(!result.finalError, "no final error without a detection");
    ASSERT_TRUE(result.elapsed >= 300ms, "ran until the deadline");
    ASSERT_EQ(link.angleWrites().size(), std::size_t{0}, "nothing to correct");
}

// No frames at all: the detector is skipped and the deadline still fires.
static void testNoFramesStillTimesOut() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget(150ms));
    const auto result = session.run(cancel);
    ASSERT_TRUE(result.status == SessionStatus::TimedOut, "times out without frames");
    ASSERT_EQ(result.detectionFailures, std::size_t{0}, "skipped iterations are not failures");
    ASSERT_EQ(link.laserOffCommands(), 1, "laser off issued");
}

// A stale frame is never processed twice.
static void testStaleFrameSkipsDetection() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    frames.publish(testing::blankFrame());
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget());
    session.step(cancel); // Idle -> Enabling
    session.step(cancel); // Enabling -> Searching
    ASSERT_TRUE(session.phase() == SessionPhase::Searching, "searching");

    session.step(cancel);
    ASSERT_EQ(session.consecutiveDetectionFailures(), std::size_t{1}, "first frame examined");
    for (int i = 0; i < 3; ++i) {
        session.step(cancel);
    }
    ASSERT_EQ(session.consecutiveDetectionFailures(), std::size_t{1}, "same frame never re-examined");

    frames.publish(testing::blankFrame());
    session.step(cancel);
    ASSERT_EQ(session.consecutiveDetectionFailures(), std::size_t{2}, "new frame examined");

    cancel = true;
    session.step(cancel);
    ASSERT_TRUE(session.status() == SessionStatus::Aborted, "cancel aborts");
    ASSERT_TRUE(!link.laserOn(), "cancel leaves the laser off");
}

// Off-target dot: the loop writes bounded, rate-limited corrections.
static void testCorrectionsAreBounded() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};
    const auto config = fastConfig();

    AcquisitionSession session(link, frames, config, centreTarget(5000ms));
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (link.angleWrites().size() < 5 && std::chrono::steady_clock::now() < deadline) {
        frames.publish(testing::frameWithDots({{100, 400}}));
        session.step(cancel);
    }

    const auto writes = link.angleWrites();
    ASSERT_TRUE(writes.size() >= 5, "several corrections written");
    ASSERT_TRUE(session.status() == SessionStatus::Running, "still running while off target");

    double previousH = link.limits.horizontal.midpoint();
    double previousV = link.limits.vertical.midpoint();
    for (const auto& a : writes) {
        ASSERT_TRUE(a.h >= 30.0 && a.h <= 150.0, "h within limits");
        ASSERT_TRUE(a.v >= 0.0 && a.v <= 120.0, "v within limits");
        ASSERT_TRUE(std::fabs(a.h - previousH) <= config.maxStepPerUpdate + 1e-9, "h step bounded");
        ASSERT_TRUE(std::fabs(a.v - previousV) <= config.maxStepPerUpdate + 1e-9, "v step bounded");
        previousH = a.h;
        previousV = a.v;
    }
    // Dot left of and below centre: h rises and v falls from the midpoint.
    ASSERT_TRUE(writes.back().h > 90.0, "horizontal correction toward target");
    ASSERT_TRUE(writes.back().v < 60.0, "vertical correction toward target");

    const auto commanded = session.commandedPosition();
    ASSERT_TRUE(commanded && commanded->x > 0.5, "commanded position reported");

    cancel = true;
    const auto result = session.run(cancel);
    ASSERT_TRUE(result.status == SessionStatus::Aborted, "cancel aborts");
    ASSERT_EQ(result.actuatorWrites, writes.size(), "writes counted");
    ASSERT_TRUE(result.finalError && *result.finalError > 0.02, "final error reported");
    ASSERT_TRUE(!link.laserOn(), "laser off after abort");
}

// Closed loop: the dot follows the commanded angles until it lands inside the
// deadband, then the session converges and stops writing.
static void testClosedLoopConverges() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};

    TargetSpec target;
    target.target = {0.6, 0.4};
    target.deadbandRadius = 0.02;
    target.maxDuration = 10000ms;

    AcquisitionSession session(link, frames, fastConfig(), target);
    const auto deadline = std::chrono::steady_clock::now() + 8s;
    while (!session.isTerminal() && std::chrono::steady_clock::now() < deadline) {
        const auto position = session.commandedPosition().value_or(core::NormalizedPoint{0.5, 0.5});
        frames.publish(testing::frameWithDots({{static_cast<int>(std::lround(position.x * 640)),
                                                static_cast<int>(std::lround(position.y * 480))}}));
        session.step(cancel);
        std::this_thread::sleep_for(5ms);
    }

    ASSERT_TRUE(session.status() == SessionStatus::Converged, "loop converges on the target");
    const auto writes = link.angleWrites().size();
    ASSERT_TRUE(writes > 0, "corrections were written");

    const auto result = session.result();
    ASSERT_TRUE(result.finalError && *result.finalError < 0.02, "final error inside deadband");
    ASSERT_EQ(result.actuatorWrites, writes, "writes counted");

    const auto commanded = session.commandedPosition();
    ASSERT_TRUE(commanded && std::fabs(commanded->x - 0.6) < 0.03 && std::fabs(commanded->y - 0.4) < 0.03,
                "commanded position near target");

    frames.publish(testing::frameWithDots({{100, 100}}));
    ASSERT_TRUE(session.step(cancel) == SessionStatus::Converged, "terminal phase is sticky");
    ASSERT_EQ(link.angleWrites().size(), writes, "no writes after convergence");
    ASSERT_TRUE(!link.laserOn(), "laser off after convergence");
    ASSERT_EQ(link.laserOffCommands(), 1, "one off command");
}

static void testRejectedWriteIsNotFatal() {
    FakeActuatorLink link;
    link.rejectAngleWrites(true);
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget(400ms));
    for (int i = 0; i < 10; ++i) {
        frames.publish(testing::frameWithDots({{500, 100}}));
        session.step(cancel);
        std::this_thread::sleep_for(25ms);
    }
    ASSERT_TRUE(!session.isTerminal() || session.status() == SessionStatus::TimedOut,
                "rejections do not end the session");
    ASSERT_EQ(link.angleWrites().size(), std::size_t{0}, "nothing applied");

    const auto result = session.run(cancel);
    ASSERT_TRUE(result.status == SessionStatus::TimedOut, "session runs to its deadline");
    ASSERT_TRUE(!link.laserOn(), "laser off");
}

static void testWriteFailureEndsSession() {
    FakeActuatorLink link;
    link.failAngleWrites(true);
    core::FrameSlot frames;
    frames.publish(testing::frameWithDots({{500, 100}}));
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget());
    const auto result = session.run(cancel);
    ASSERT_TRUE(result.status == SessionStatus::ActuatorUnreachable, "unreachable actuator ends the session");
    ASSERT_EQ(link.laserOnCommands(), 1, "laser had been enabled");
    ASSERT_EQ(link.forcedLaserOffs(), 1, "exit goes past the unreachable mark");
    ASSERT_EQ(link.laserOffCommands(), 1, "off reached the controller");
    ASSERT_TRUE(!link.laserOn(), "controller left with the laser off");
    ASSERT_TRUE(!session.laserEnabled(), "session no longer owns an enabled laser");
}

// Even a forced "off" cannot get through: the session still terminates.
static void testDeadControllerStillTerminates() {
    FakeActuatorLink link;
    link.failAngleWrites(true);
    link.killController(true);
    core::FrameSlot frames;
    frames.publish(testing::frameWithDots({{500, 100}}));
    std::atomic<bool> cancel{false};

    AcquisitionSession session(link, frames, fastConfig(), centreTarget());
    const auto result = session.run(cancel);
    ASSERT_TRUE(result.status == SessionStatus::ActuatorUnreachable, "session ends unreachable");
    ASSERT_EQ(link.forcedLaserOffs(), 1, "one forced off, no retry loop");
    ASSERT_EQ(link.laserOffCommands(), 0, "nothing reached the controller");
}

static void testDestructorTurnsLaserOff() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    std::atomic<bool> cancel{false};
    {
        AcquisitionSession session(link, frames, fastConfig(), centreTarget());
        session.step(cancel);
        session.step(cancel);
        ASSERT_TRUE(session.laserEnabled(), "laser on while searching");
    }
    ASSERT_TRUE(!link.laserOn(), "destroying a live session turns the laser off");
}

static void testTargetFromBoundingBox() {
    const auto aimed = TargetSpec::fromBoundingBox(200.0, 120.0, 80.0, 240.0, 640, 480);
    ASSERT_TRUE(std::fabs(aimed.target.x - 240.0 / 640.0) < 1e-12, "box centre x");
    ASSERT_TRUE(std::fabs(aimed.target.y - 200.0 / 480.0) < 1e-12, "upper third y");

    const auto outside = TargetSpec::fromBoundingBox(600.0, -90.0, 200.0, 30.0, 640, 480);
    ASSERT_TRUE(outside.target.x == 1.0 && outside.target.y == 0.0, "target clamped into the frame");

    bool threw = false;
    try {
        (void)TargetSpec::fromBoundingBox(0, 0, 10, 10, 0, 480);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "empty frame size rejected");
}

int main() {
    testLimitsFailure();
    testAlreadyInsideDeadband();
    testDetectionNeverSucceeds();
    testNoFramesStillTimesOut();
    testStaleFrameSkipsDetection();
    testCorrectionsAreBounded();
    testClosedLoopConverges();
    testRejectedWriteIsNotFatal();
    testWriteFailureEndsSession();
    testDeadControllerStillTerminates();
    testDestructorTurnsLaserOff();
    testTargetFromBoundingBox();

    if (g_failures) {
        lasertrack::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lasertrack::logInfo("AcquisitionSession tests passed.\n");
    return 0;
}
