#include "lasertrack/core/Errors.hpp"

#include <string>

namespace lasertrack {

namespace {

class TargetingCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "lasertrack"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::detection_ambiguous:     return "more than one laser dot candidate";
            case errc::detection_not_found:     return "laser dot not found";
            case errc::search_bounds_exhausted: return "threshold search exhausted";
            case errc::actuator_unreachable:    return "actuator unreachable";
            case errc::actuator_timeout:        return "actuator timed out";
            case errc::limits_unavailable:      return "servo limits unavailable";
            case errc::session_timed_out:       return "session timed out";
            case errc::session_aborted:         return "session aborted";
            case errc::command_rejected:        return "actuator rejected command";
            case errc::malformed_reply:         return "malformed actuator reply";
            case errc::session_already_running: return "a session is already running";
        }
        return "unknown lasertrack error";
    }
};

} // namespace

const std::error_category& targeting_category() noexcept {
    static const TargetingCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), targeting_category()};
}

bool isTransportFailure(const std::error_code& ec) noexcept {
    if (!ec) {
        return false;
    }
    if (ec == errc::command_rejected) {
        return false;
    }
    // Everything else that can come back from an exchange is either a socket
    // error, a deadline, or a reply we could not make sense of.
    return true;
}

} // namespace lasertrack
