#include "colourlink/net/Resolve.hpp"

#include <cctype>
#include <limits>

namespace colourlink::net {
namespace {

bool parsePort(const std::string& text, unsigned short& out) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > std::numeric_limits<unsigned short>::max()) {
        return false;
    }
    out = static_cast<unsigned short>(value);
    return true;
}

std::string stripBrackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

} // namespace

HostPort splitHostPort(const std::string& address, unsigned short defaultPort) {
    const auto colon = address.rfind(':');
    if (colon != std::string::npos) {
        const std::string host = address.substr(0, colon);
        unsigned short port = 0;
        // A bare IPv6 literal has several colons and no brackets; its tail is not a port.
        const bool bareIpv6 = host.find(':') != std::string::npos
                            && !host.empty() && host.front() != '[';
        if (!bareIpv6 && parsePort(address.substr(colon + 1), port)) {
            return HostPort{stripBrackets(host), std::to_string(port)};
        }
    }
    return HostPort{stripBrackets(address), std::to_string(defaultPort)};
}

} // namespace colourlink::net
