#pragma once

#include <asio.hpp>
#include <system_error>

namespace wirecast::net {

// Standalone Asio, reachable as wirecast::net::asio so the helpers never spell
// the global namespace directly.
namespace asio = ::asio;

using tcp = asio::ip::tcp;

} // namespace wirecast::net
