#include "colourlink/colourspace/Connection.hpp"

#include "colourlink/colourspace/WireFrame.hpp"
#include "colourlink/core/Errors.hpp"
#include "colourlink/log/Log.hpp"
#include "colourlink/net/Resolve.hpp"

namespace colourlink::colourspace {

Connection::Connection() = default;

Connection::~Connection() {
    close();
}

expected<void> Connection::connect(const std::string& address, net::duration timeout) {
    const auto target = net::splitHostPort(address, config::COLOURSPACE_PORT_DEFAULT);

    net::tcp::resolver::results_type endpoints;
    if (auto ec = net::resolve(net::context(), target.host, target.service, endpoints); ec) {
        logError("[Connection] resolve ", target.host, ":", target.service,
                 " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (endpoints.empty()) {
        logError("[Connection] ", target.host, ":", target.service, " resolved to no endpoints\n");
        return unexpected(make_error_code(Errc::NoReachableEndpoint));
    }

    if (auto ec = tcpClient.connect(endpoints, timeout); ec) {
        logError("[Connection] connect failed: ", ec.message(),
                 " (to ", target.host, ":", target.service, ")",
                 " timeout=", timeout.count(), "ms\n");
        return unexpected(ec);
    }

    tcpClient.setLowLatency();
    remoteAddress = target.host + ":" + target.service;
    logInfo("[Connection] connected to ", remoteAddress, "\n");
    return {};
}

expected<void> Connection::sendFrame(std::string_view payload) {
    std::lock_guard lock(writeMutex);
    Direction out{tcpClient, writeTimeout};
    return frame::writeFrame(out, payload);
}

expected<std::optional<std::string>> Connection::receiveFrame() {
    std::lock_guard lock(readMutex);
    // Idle periods are normal; only a reset or the remote's signal ends a read.
    Direction in{tcpClient, net::TimeoutConfig::NO_DEADLINE};
    auto received = frame::readFrame(in);
    if (!received && in.consumed > 0 && !isProtocolViolation(received.error())) {
        // The next header would be read from the middle of this frame.
        logError("[Connection] read failed ", in.consumed, " bytes into a frame: ",
                 received.error().message(), "; closing ", remoteAddress, "\n");
        tcpClient.close();
        return unexpected(make_error_code(Errc::FramingLost));
    }
    return received;
}

void Connection::close() {
    tcpClient.close();
}

} // namespace colourlink::colourspace
