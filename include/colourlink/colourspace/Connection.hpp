#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "colourlink/core/Expected.hpp"
#include "colourlink/net/TcpClient.hpp"
#include "colourlink/colourspace/ColourSpaceConfig.hpp"

namespace colourlink::colourspace {

/**
 * @brief Owns the live socket to a ColourSpace instrument and moves whole frames over it.
 *
 * Connection is attempted once; there is no reconnect here. The socket is
 * shared by the receiver and sender loops. Each direction has its own lock,
 * held for exactly one frame, so frames never interleave while a receiver
 * blocked in `receiveFrame()` does not hold up `sendFrame()`.
 */
class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Resolve "host[:port]" and connect to the first endpoint that answers.
     * @param address Host name or IP, optionally with ":port" (defaults to 20002).
     * @param timeout Per-endpoint connect deadline.
     *
     * Fails with NoReachableEndpoint when resolution yields nothing, otherwise
     * with the last endpoint's error.
     */
    expected<void> connect(const std::string& address,
                           net::duration timeout = config::CONNECT_TIMEOUT);

    void setWriteTimeout(net::duration timeout) { writeTimeout = timeout; }

    /// Write one frame; fails with PayloadTooLarge or the socket error.
    expected<void> sendFrame(std::string_view payload);

    /**
     * @brief Block, without deadline, until one frame arrives.
     *
     * std::nullopt is the disconnect signal. A failure after part of a frame
     * was consumed (including an oversized length) closes the socket and
     * reports FramingLost; a failure before any byte was consumed leaves the
     * stream aligned and returns the socket error.
     */
    expected<std::optional<std::string>> receiveFrame();

    /// Abort blocked operations and release the socket. Idempotent.
    void close();

    const std::string& remote() const { return remoteAddress; }

private:
    // Adapts the client to the stream shape frame::readFrame/writeFrame expect.
    struct Direction {
        net::TcpClient& client;
        net::duration timeout;
        std::size_t consumed = 0;

        std::error_code read_exact(void* buf, std::size_t n) {
            std::size_t got = 0;
            const auto ec = client.read_exact(buf, n, timeout, &got);
            consumed += got;
            return ec;
        }
        std::error_code write_all(const void* buf, std::size_t n) {
            return client.write_all(buf, n, timeout);
        }
    };

    net::TcpClient tcpClient;
    std::mutex readMutex;
    std::mutex writeMutex;
    net::duration writeTimeout = config::WRITE_TIMEOUT;
    std::string remoteAddress;
};

} // namespace colourlink::colourspace
