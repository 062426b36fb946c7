#include "colourlink/colourspace/Connection.hpp"
#include "colourlink/core/Errors.hpp"
#include "colourlink/log/Log.hpp"

#include <chrono>
#include <future>
#include <optional>
#include <string>

#include "DummyColourSpaceServer.hpp"

using namespace std::chrono_literals;
using namespace colourlink;
using namespace colourlink::colourspace;
using colourlink::test::DummyColourSpaceServer;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { colourlink::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

using Received = expected<std::optional<std::string>>;

// Receive on another thread; a receive still blocked after @p limit is
// unblocked by closing the connection and reported as std::nullopt.
std::optional<Received> receiveWithin(Connection& connection, std::chrono::milliseconds limit = 2000ms) {
    auto pending = std::async(std::launch::async, [&connection] { return connection.receiveFrame(); });
    if (pending.wait_for(limit) != std::future_status::ready) {
        connection.close();
        pending.wait();
        return std::nullopt;
    }
    return pending.get();
}

bool openConnection(DummyColourSpaceServer& server, Connection& connection) {
    return server.listening()
        && connection.connect(server.address(), 1000ms).has_value()
        && server.accept();
}

} // namespace

static void testFramesBothWays() {
    DummyColourSpaceServer server;
    Connection connection;
    ASSERT_TRUE(openConnection(server, connection), "connected");

    ASSERT_TRUE(connection.sendFrame("<a/>").has_value(), "send");
    std::string payload;
    ASSERT_TRUE(server.readPayload(payload) && payload == "<a/>", "server saw the frame");

    server.sendPayload("<b/>");
    auto received = receiveWithin(connection);
    ASSERT_TRUE(received && *received && (*received)->has_value() && ***received == "<b/>",
                "client saw the frame");
}

static void testTruncatedFrameClosesStream() {
    DummyColourSpaceServer server;
    Connection connection;
    ASSERT_TRUE(openConnection(server, connection), "connected");

    std::optional<Received> first;
    std::optional<Received> second;
    {
        colourlink::log::ScopedLogHandlers quiet([](std::string_view) {}, [](std::string_view) {});

        // Header promises 100 bytes; only 10 arrive before the peer goes away.
        server.sendHeader(100);
        server.sendRaw("<CS_RMC ve");
        server.closeClient();

        first = receiveWithin(connection);
        // The socket is closed, so the next receive fails at once rather than
        // reading a header out of the old payload.
        second = receiveWithin(connection);
    }

    ASSERT_TRUE(first && !*first && first->error() == make_error_code(Errc::FramingLost),
                "mid-frame failure reported as FramingLost");
    ASSERT_TRUE(second && !*second, "stream closed after losing alignment");
}

static void testOversizedLengthRefused() {
    DummyColourSpaceServer server;
    Connection connection;
    ASSERT_TRUE(openConnection(server, connection), "connected");

    // Raw XML where a header belongs: "<?xm" reads as a ~1 GB length.
    std::optional<Received> first;
    std::optional<Received> second;
    {
        colourlink::log::ScopedLogHandlers quiet([](std::string_view) {}, [](std::string_view) {});
        server.sendRaw("<?xml version=\"1.0\"?>");
        first = receiveWithin(connection);
        second = receiveWithin(connection);
    }

    ASSERT_TRUE(first.has_value(), "oversized length does not block");
    ASSERT_TRUE(first && !*first && first->error() == make_error_code(Errc::FramingLost),
                "oversized length reported as FramingLost");
    ASSERT_TRUE(second && !*second, "stream closed afterwards");
}

static void testWriteTimeoutFailsConcurrentRead() {
    DummyColourSpaceServer server;
    Connection connection;
    ASSERT_TRUE(openConnection(server, connection), "connected");
    connection.setWriteTimeout(200ms);

    std::optional<Received> afterTimeout;
    bool timedOut = false;
    {
        colourlink::log::ScopedLogHandlers quiet([](std::string_view) {}, [](std::string_view) {});

        // A reader parked with no deadline, as the worker's receiver is.
        auto reader = std::async(std::launch::async, [&connection] { return connection.receiveFrame(); });

        // The server never reads, so this cannot fit in the socket buffers.
        const std::string large(32u * 1024u * 1024u, 'a');
        auto sent = connection.sendFrame(large);
        timedOut = !sent && sent.error() == make_error_code(asio::error::timed_out);

        if (reader.wait_for(2s) == std::future_status::ready) {
            afterTimeout = reader.get();
        } else {
            connection.close();
            reader.wait();
        }
    }

    ASSERT_TRUE(timedOut, "write reports timed_out");
    ASSERT_TRUE(afterTimeout.has_value(), "blocked read released by the write timeout");
    ASSERT_TRUE(afterTimeout && !afterTimeout->has_value(), "released read is an error, not data");
}

int main() {
    testFramesBothWays();
    testTruncatedFrameClosesStream();
    testOversizedLengthRefused();
    testWriteTimeoutFailsConcurrentRead();

    if (g_failures) {
        colourlink::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    colourlink::logInfo("Connection tests passed.\n");
    return 0;
}
