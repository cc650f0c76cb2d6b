#include "lasertrack/core/Errors.hpp"
#include "lasertrack/core/Frame.hpp"
#include "lasertrack/log/Log.hpp"
#include "lasertrack/session/SessionRunner.hpp"

#include "FakeActuatorLink.hpp"
#include "SyntheticFrames.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace lasertrack;
using namespace std::chrono_literals;
using lasertrack::session::SessionRunner;
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

static TargetSpec target(std::chrono::milliseconds maxDuration) {
    TargetSpec t;
    t.maxDuration = maxDuration;
    return t;
}

static void testSecondStartRejected() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    SessionRunner runner(link, frames, fastConfig());

    ASSERT_TRUE(runner.start(target(5000ms)), "first start accepted");
    ASSERT_TRUE(runner.isRunning(), "session running");

    auto second = runner.start(target(5000ms));
    ASSERT_TRUE(!second && second.error() == errc::session_already_running, "second start rejected");

    runner.cancel();
    const auto result = runner.wait();
    ASSERT_TRUE(result && result->status == SessionStatus::Aborted, "cancelled session ends Aborted");
    ASSERT_TRUE(!runner.isRunning(), "runner idle after wait");
    ASSERT_TRUE(!link.laserOn(), "laser off after cancel");
    ASSERT_EQ(link.sessionsStarted(), 1, "only one session ever began");
}

static void testCancelIsPromptAndLaserOff() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    std::atomic<bool> producing{true};
    std::thread producer([&] {
        while (producing) {
            frames.publish(testing::blankFrame());
            std::this_thread::sleep_for(10ms);
        }
    });

    SessionRunner runner(link, frames, fastConfig());
    ASSERT_TRUE(runner.start(target(10000ms)), "start accepted");
    std::this_thread::sleep_for(100ms);
    ASSERT_TRUE(link.laserOn(), "laser on while searching");

    const auto t0 = std::chrono::steady_clock::now();
    runner.cancel();
    const auto result = runner.wait();
    const auto latency = std::chrono::steady_clock::now() - t0;

    producing = false;
    producer.join();

    ASSERT_TRUE(result && result->status == SessionStatus::Aborted, "status is Aborted");
    ASSERT_TRUE(latency < 1s, "cancel takes effect within one cycle");
    ASSERT_TRUE(!link.laserOn(), "laser disabled on abort");
    ASSERT_TRUE(link.laserOffCommands() >= 1, "off command issued");
}

// A cancel() issued once the runner reports running must reach that session,
// even when it races with the tail of start().
static void testCancelRacingStart() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    SessionRunner runner(link, frames, fastConfig());

    for (int round = 0; round < 10; ++round) {
        std::atomic<bool> go{false};
        std::thread canceller([&] {
            while (!go) {
                std::this_thread::yield();
            }
            while (!runner.isRunning()) {
                std::this_thread::yield();
            }
            runner.cancel();
        });

        go = true;
        ASSERT_TRUE(runner.start(target(3000ms)), "start accepted");
        canceller.join();

        const auto t0 = std::chrono::steady_clock::now();
        const auto result = runner.wait();
        const auto latency = std::chrono::steady_clock::now() - t0;
        ASSERT_TRUE(result && result->status == SessionStatus::Aborted, "racing cancel aborts the session");
        ASSERT_TRUE(latency < 1s, "cancel was not lost");
        ASSERT_TRUE(!link.laserOn(), "laser off after every round");
    }
}

static void testSequentialSessions() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    frames.publish(testing::frameWithDots({{320, 240}}));
    SessionRunner runner(link, frames, fastConfig());

    ASSERT_TRUE(runner.start(target(2000ms)), "first session");
    auto first = runner.wait();
    ASSERT_TRUE(first && first->status == SessionStatus::Converged, "first session converges");

    // The second session gets a fresh frame of its own and starts from scratch.
    frames.publish(testing::frameWithDots({{320, 240}}));
    ASSERT_TRUE(runner.start(target(2000ms)), "second session accepted after the first ended");
    auto second = runner.wait();
    ASSERT_TRUE(second && second->status == SessionStatus::Converged, "second session converges");
    ASSERT_EQ(link.sessionsStarted(), 2, "two sessions began");
    ASSERT_EQ(link.limitQueryCount(), 2, "limits queried once per session");
}

static void testUnreachableActuatorResult() {
    FakeActuatorLink link;
    link.failLimitsQuery(true);
    core::FrameSlot frames;
    SessionRunner runner(link, frames, fastConfig());

    ASSERT_TRUE(runner.start(target(2000ms)), "start accepted");
    const auto result = runner.wait();
    ASSERT_TRUE(result && result->status == SessionStatus::ActuatorUnreachable, "status is ActuatorUnreachable");
    ASSERT_EQ(link.laserOnCommands(), 0, "laser never enabled");
    ASSERT_TRUE(runner.lastResult().has_value(), "result kept for later readers");
}

static void testInvalidTargetThrows() {
    FakeActuatorLink link;
    core::FrameSlot frames;
    SessionRunner runner(link, frames, fastConfig());

    bool threw = false;
    try {
        (void)runner.start(target(0ms));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "zero duration rejected");
    ASSERT_TRUE(!runner.isRunning(), "failed start leaves the runner idle");
    ASSERT_TRUE(!runner.wait().has_value(), "no result without a session");
}

int main() {
    testSecondStartRejected();
    testCancelIsPromptAndLaserOff();
    testCancelRacingStart();
    testSequentialSessions();
    testUnreachableActuatorResult();
    testInvalidTargetThrows();

    if (g_failures) {
        lasertrack::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lasertrack::logInfo("SessionRunner tests passed.\n");
    return 0;
}
