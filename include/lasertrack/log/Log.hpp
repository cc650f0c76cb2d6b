#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace lasertrack::log {

/**
 * @brief Process-wide log sinks.
 *
 * Info and debug messages go to the info sink (stdout by default), errors to
 * the error sink (stderr by default). Messages carry their own
 * "[Component] " prefix and trailing newline. Debug output is per-frame
 * chatter from the control loop and is dropped unless enabled.
 *
 * All functions are thread-safe; the session thread, the Asio I/O thread and
 * the capture loop log concurrently.
 */
enum class Level {
    Debug,
    Info,
    Error
};

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

/// Messages below @p level are dropped. Defaults to Level::Info.
void setMinimumLevel(Level level);
Level minimumLevel();
bool enabled(Level level);

/// Prefix every message with the time since the first log call, e.g. "[+1520.4ms] ".
void setTimestamps(bool on);

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename First, typename... Rest>
using EnableIfFormatted = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !std::is_convertible<std::decay_t<First>, std::string_view>::value>;

} // namespace detail

// Debug messages are only formatted when debug output is enabled.
template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!enabled(Level::Debug)) {
        return;
    }
    logDebug(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace lasertrack::log

namespace lasertrack {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logDebug;
using log::logInfo;
using log::logError;
} // namespace lasertrack
