#pragma once
#include "lasertrack/core/Expected.hpp"
#include "lasertrack/net/NetConfig.hpp"
#include "lasertrack/net/NetService.hpp"

#include <string>

namespace lasertrack::net {

/**
 * Blocking lookup of a controller address on the shared I/O context.
 *
 * Accepts a hostname or a literal address. An empty result set is reported
 * as `host_not_found` so callers never see a successful, unusable lookup.
 */
inline expected<tcp::resolver::results_type> resolve(const std::string& host, unsigned short port) {
    error_code ec;
    tcp::resolver resolver(io_context());
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return unexpected(ec);
    }
    if (results.empty()) {
        return unexpected(error_code(asio::error::host_not_found));
    }
    return results;
}

} // namespace lasertrack::net
