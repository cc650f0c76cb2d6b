// Expected.hpp
// -----------------------------------------------------------------------------
// Success/error pair used across lasertrack. Operations that can fail at
// runtime (actuator I/O, session start) return expected<T>. The error is
// always std::error_code, so the targeting codes in Errors.hpp and raw
// Asio/system codes travel through the same channel.

#pragma once

#include "lasertrack/core/Errors.hpp"

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace lasertrack {

template <typename T>
using expected = tl::expected<T, std::error_code>;

using unexpected_t = tl::unexpected<std::error_code>;

[[nodiscard]] inline unexpected_t unexpected(std::error_code error) {
    return unexpected_t(error);
}

/// `return unexpected(errc::command_rejected);`
[[nodiscard]] inline unexpected_t unexpected(errc error) {
    return unexpected_t(make_error_code(error));
}

} // namespace lasertrack
