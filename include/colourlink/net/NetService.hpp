#pragma once
#include "colourlink/net/NetConfig.hpp"

#include <memory>
#include <optional>
#include <thread>

namespace colourlink::net {

/**
 * @brief Process-wide io_context, run by one background thread.
 *
 * Sockets, resolvers and deadline timers all complete here while the
 * receiver and sender threads wait on them. Clients keep the context alive
 * through the shared_ptr from `sharedContext()`.
 *
 * Created on first use and stopped at exit, after its work guard is dropped.
 */
class NetService {
public:
    static NetService& instance();

    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    std::shared_ptr<asio::io_context> context() const { return context_; }

private:
    NetService();
    void run();

    std::shared_ptr<asio::io_context> context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> keepAlive_;
    std::thread runner_;
};

inline std::shared_ptr<asio::io_context> sharedContext() {
    return NetService::instance().context();
}

inline asio::io_context& context() {
    return *NetService::instance().context();
}

} // namespace colourlink::net
