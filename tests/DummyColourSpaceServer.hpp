// DummyColourSpaceServer.hpp
// -----------------------------------------------------------------------------
// Loopback stand-in for a ColourSpace instrument, shared by the socket tests.
// Listens on 127.0.0.1 with an OS-chosen port, accepts one client and speaks
// length-prefixed frames with blocking POSIX calls.

#pragma once

#include <cstdint>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace colourlink::test {

class DummyColourSpaceServer {
public:
    DummyColourSpaceServer() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) return;

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0; // let the OS choose

        socklen_t len = sizeof(addr);
        listening_ = ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0
                  && ::listen(listenFd_, 4) == 0
                  && ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
        port_ = ntohs(addr.sin_port);
    }

    ~DummyColourSpaceServer() {
        closeClient();
        if (listenFd_ >= 0) {
            ::close(listenFd_);
        }
    }

    DummyColourSpaceServer(const DummyColourSpaceServer&) = delete;
    DummyColourSpaceServer& operator=(const DummyColourSpaceServer&) = delete;

    bool listening() const { return listening_; }
    unsigned short port() const { return port_; }
    std::string address() const { return "127.0.0.1:" + std::to_string(port_); }

    bool accept() {
        pollfd pfd{listenFd_, POLLIN, 0};
        if (::poll(&pfd, 1, 2000) <= 0) {
            return false;
        }
        clientFd_ = ::accept(listenFd_, nullptr, nullptr);
        if (clientFd_ < 0) {
            return false;
        }
        timeval tv{};
        tv.tv_sec = 2;
        ::setsockopt(clientFd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        return true;
    }

    /// Next payload from the client; false on timeout or close.
    bool readPayload(std::string& out) {
        unsigned char header[4];
        if (!recvAll(header, sizeof(header))) {
            return false;
        }
        const std::uint32_t length = (std::uint32_t{header[0]} << 24) | (std::uint32_t{header[1]} << 16)
                                   | (std::uint32_t{header[2]} << 8) | std::uint32_t{header[3]};
        out.assign(length, '\0');
        return length == 0 || recvAll(out.data(), length);
    }

    /// True once the client has closed its end.
    bool peerClosed() {
        char byte;
        return ::recv(clientFd_, &byte, 1, 0) == 0;
    }

    bool sendHeader(std::int32_t length) {
        const auto raw = static_cast<std::uint32_t>(length);
        const unsigned char header[4] = {
            static_cast<unsigned char>(raw >> 24), static_cast<unsigned char>(raw >> 16),
            static_cast<unsigned char>(raw >> 8), static_cast<unsigned char>(raw)};
        return sendAll(header, sizeof(header));
    }

    bool sendPayload(const std::string& payload) {
        return sendHeader(static_cast<std::int32_t>(payload.size()))
            && sendAll(payload.data(), payload.size());
    }

    bool sendRaw(const std::string& bytes) {
        return sendAll(bytes.data(), bytes.size());
    }

    /// Half-close: the client reads end of stream but may keep writing.
    void shutdownWrite() {
        if (clientFd_ >= 0) {
            ::shutdown(clientFd_, SHUT_WR);
        }
    }

    /// Abort the connection with a reset so the client's writes fail.
    void resetClient() {
        if (clientFd_ < 0) return;
        linger hard{};
        hard.l_onoff = 1;
        hard.l_linger = 0;
        ::setsockopt(clientFd_, SOL_SOCKET, SO_LINGER, &hard, sizeof(hard));
        ::close(clientFd_);
        clientFd_ = -1;
    }

    void closeClient() {
        if (clientFd_ < 0) return;
        ::shutdown(clientFd_, SHUT_RDWR);
        ::close(clientFd_);
        clientFd_ = -1;
    }

private:
    bool recvAll(void* buf, std::size_t n) {
        auto* p = static_cast<char*>(buf);
        while (n > 0) {
            const auto got = ::recv(clientFd_, p, n, 0);
            if (got <= 0) {
                return false;
            }
            p += got;
            n -= static_cast<std::size_t>(got);
        }
        return true;
    }

    bool sendAll(const void* buf, std::size_t n) {
        const auto* p = static_cast<const char*>(buf);
        while (n > 0) {
            const auto sent = ::send(clientFd_, p, n, MSG_NOSIGNAL);
            if (sent <= 0) {
                return false;
            }
            p += sent;
            n -= static_cast<std::size_t>(sent);
        }
        return true;
    }

    int listenFd_ = -1;
    int clientFd_ = -1;
    unsigned short port_ = 0;
    bool listening_ = false;
};

} // namespace colourlink::test
