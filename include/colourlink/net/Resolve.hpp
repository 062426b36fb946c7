#pragma once
#include "colourlink/net/NetConfig.hpp"
#include <string>

namespace colourlink::net {

/**
 * @brief Host and service split out of a "host[:port]" string.
 */
struct HostPort {
    std::string host;
    std::string service;
};

/**
 * splitHostPort
 *
 * Splits "host:port" into its parts. When the text after the last ':' is not
 * a valid 16-bit port, the whole string is the host and `defaultPort` is
 * used. Bracketed IPv6 literals ("[::1]:20002") lose their brackets.
 */
HostPort splitHostPort(const std::string& address, unsigned short defaultPort);

/**
 * resolve
 *
 * Simple synchronous DNS lookup helper. Given `host` and `service` (e.g.
 * "colourspace.local", "20002") it returns a list of endpoints for the TCP
 * client connect overload that accepts resolver results.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out)
{
    error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, service, ec);
    return ec;
}

} // namespace colourlink::net
