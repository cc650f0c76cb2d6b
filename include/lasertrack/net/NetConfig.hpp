#pragma once

#include <asio.hpp>
#include <system_error>

// Single entry point to standalone Asio. Everything above lasertrack::net
// names sockets and errors through these aliases.
namespace lasertrack::net {

namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;

} // namespace lasertrack::net
