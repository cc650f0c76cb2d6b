#include "lasertrack/log/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>

namespace lasertrack::log {

namespace {

struct Sinks {
    std::mutex mutex;
    LogHandler info;
    LogHandler error;
};

void writeTo(std::ostream& os, std::string_view message) {
    os << message;
    os.flush();
}

LogHandler stdoutSink() {
    return [](std::string_view message) { writeTo(std::cout, message); };
}

LogHandler stderrSink() {
    return [](std::string_view message) { writeTo(std::cerr, message); };
}

Sinks& sinks() {
    static Sinks instance{{}, stdoutSink(), stderrSink()};
    return instance;
}

std::atomic<int> minimum{static_cast<int>(Level::Info)};
std::atomic<bool> timestamps{false};

std::chrono::steady_clock::time_point epoch() {
    static const auto start = std::chrono::steady_clock::now();
    return start;
}

void dispatch(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    LogHandler handler;
    {
        // Copied out under the lock so a sink may itself log.
        auto& s = sinks();
        std::lock_guard lock(s.mutex);
        handler = level == Level::Error ? s.error : s.info;
    }
    if (!handler) {
        return;
    }

    if (!timestamps.load()) {
        handler(message);
        return;
    }

    const std::chrono::duration<double, std::milli> since = std::chrono::steady_clock::now() - epoch();
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "[+%.1fms] ", since.count());
    std::string line(stamp);
    line.append(message.data(), message.size());
    handler(line);
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    s.info = handler ? std::move(handler) : stdoutSink();
}

void setErrorLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    s.error = handler ? std::move(handler) : stderrSink();
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    setInfoLogHandler(std::move(infoHandler));
    setErrorLogHandler(std::move(errorHandler));
}

void resetLogHandlers() {
    setLogHandlers(nullptr, nullptr);
}

void setMinimumLevel(Level level) {
    minimum.store(static_cast<int>(level));
}

Level minimumLevel() {
    return static_cast<Level>(minimum.load());
}

bool enabled(Level level) {
    return static_cast<int>(level) >= minimum.load();
}

void setTimestamps(bool on) {
    epoch();
    timestamps.store(on);
}

void logDebug(std::string_view message) {
    dispatch(Level::Debug, message);
}

void logInfo(std::string_view message) {
    dispatch(Level::Info, message);
}

void logError(std::string_view message) {
    dispatch(Level::Error, message);
}

} // namespace lasertrack::log
