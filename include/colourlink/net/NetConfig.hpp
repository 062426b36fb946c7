#pragma once

#include <asio.hpp>
#include <system_error>

#include "colourlink/net/TimeoutConfig.hpp"

// Asio names used across colourlink. Nothing outside net/ includes asio.hpp.
namespace colourlink::net {

namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;
using duration = TimeoutConfig::duration;

// Socket operations of one client are serialised on one of these.
using strand = asio::strand<asio::io_context::executor_type>;

} // namespace colourlink::net
