#pragma once
#include "colourlink/net/NetConfig.hpp"
#include "colourlink/net/Deadline.hpp"
#include "colourlink/net/TimeoutConfig.hpp"
#include "colourlink/net/NetService.hpp"
#include "colourlink/log/Log.hpp"

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>

namespace colourlink::net {

/**
 * @brief Blocking TCP client over an Asio socket, with per-operation deadlines.
 *
 * Highlights:
 * - `connect(...)` tries each resolved endpoint with a per-attempt timeout.
 * - `read_exact(...)` and `write_all(...)` block the caller while enforcing
 *   deadlines; `TimeoutConfig::NO_DEADLINE` waits indefinitely.
 * - Every socket operation is initiated on a strand, so one thread may block
 *   in `read_exact` while another calls `write_all`. Callers still serialise
 *   operations of the same direction themselves.
 * - A `write_all` that misses its deadline closes the socket, which also
 *   fails any read in progress on another thread.
 *
 * The caller must keep the owning `asio::io_context` running while using the API.
 */
class TcpClient {
public:
    TcpClient()
    : io_(sharedContext())
    , strand_(asio::make_strand(*io_))
    , socket_(strand_)
    {}

    ~TcpClient() {
        close();
    }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    // Single endpoint: reset the socket so each attempt starts clean.
    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        return connect_one(endpoint, timeout);
    }

    // Resolver results: try each entry, return the first success or the last error.
    template <typename Results>
    std::error_code connect(Results results, duration timeout,
                       decltype(std::declval<typename Results::value_type>().endpoint(), 0) = 0) {
        std::error_code last = asio::error::host_not_found;

        for (auto& e : results) {
            auto ec = connect(e.endpoint(), timeout);
            if (!ec) return ec;
            logError("[TcpClient] connect to ", e.endpoint(), " failed: ", ec.message(), "\n");
            last = ec;
        }
        return last;
    }

    std::error_code read_exact(void* buf, std::size_t n, duration timeout,
                               std::size_t* bytesTransferredOut = nullptr) {
        return with_deadline(strand_, TimeoutConfig::sanitize(timeout),
            [this, buf, n](auto completion){
                asio::post(strand_, [this, buf, n, completion]{
                    asio::async_read(socket_, asio::buffer(buf, n), completion);
                });
            },
            [this]{ cancelOnStrand(); },
            bytesTransferredOut
        );
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        return with_deadline(strand_, TimeoutConfig::sanitize(timeout),
            [this, buf, n](auto completion){
                asio::post(strand_, [this, buf, n, completion]{
                    asio::async_write(socket_, asio::buffer(buf, n), completion);
                });
            },
            // A write abandoned part way leaves the peer mid-frame, and
            // cancel() would also abort a concurrent read. Close instead so
            // both directions fail cleanly.
            [this]{ closeOnStrand(); }
        );
    }

    void setLowLatency() {
        runOnStrand([this]{
            std::error_code ec;
            socket_.set_option(tcp::no_delay(true), ec);
            socket_.set_option(asio::socket_base::keep_alive(true), ec);
        });
    }

    // Pattern: cancel -> shutdown -> close, all on the strand.
    void close() {
        runOnStrand([this]{ closeOnStrand(); });
    }

private:
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        return with_deadline(strand_, TimeoutConfig::sanitize(timeout),
            [this, ep](auto completion){
                asio::post(strand_, [this, ep, completion]{
                    socket_.async_connect(ep, completion);
                });
            },
            [this]{ cancelOnStrand(); }
        );
    }

    void cancelOnStrand() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void closeOnStrand() {
        if (!socket_.is_open()) return;
        logInfo("[TcpClient] close()\n");
        std::error_code ec;
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    // Run fn on the strand and wait for it, so socket state is only touched there.
    template <typename Fn>
    void runOnStrand(Fn fn) {
        if (strand_.running_in_this_thread()) {
            fn();
            return;
        }
        std::promise<void> done;
        auto finished = done.get_future();
        asio::post(strand_, [&fn, &done]{
            fn();
            done.set_value();
        });
        finished.wait();
    }

    std::shared_ptr<asio::io_context> io_;
    strand strand_;
    tcp::socket socket_;
};

} // namespace colourlink::net
