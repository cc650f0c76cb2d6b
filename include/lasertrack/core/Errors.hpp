#pragma once

#include <system_error>

namespace lasertrack {

/**
 * @brief Failure taxonomy of the targeting core.
 *
 * Detection codes are per-frame and never leave the session. Actuator codes
 * escalate to the session's terminal status. Session codes describe how a
 * session ended and are what callers see through `SessionResult`.
 */
enum class errc {
    detection_ambiguous = 1,
    detection_not_found,
    search_bounds_exhausted,
    actuator_unreachable,
    actuator_timeout,
    limits_unavailable,
    session_timed_out,
    session_aborted,
    command_rejected,
    malformed_reply,
    session_already_running
};

const std::error_category& targeting_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

/// True for errors worth one reconnect-and-resend on the actuator link.
bool isTransportFailure(const std::error_code& ec) noexcept;

} // namespace lasertrack

namespace std {
template <>
struct is_error_code_enum<lasertrack::errc> : true_type {};
} // namespace std
