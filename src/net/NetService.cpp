#include "colourlink/net/NetService.hpp"
#include "colourlink/log/Log.hpp"

#include <exception>

namespace colourlink::net {

NetService& NetService::instance() {
    static NetService service;
    return service;
}

NetService::NetService()
: context_(std::make_shared<asio::io_context>())
{
    keepAlive_.emplace(asio::make_work_guard(*context_));
    runner_ = std::thread([this]{ run(); });
}

NetService::~NetService() {
    keepAlive_.reset();
    context_->stop();
    if (runner_.joinable()) {
        runner_.join();
    }
}

// A handler that throws must not take every socket in the process with it.
void NetService::run() {
    while (!context_->stopped()) {
        try {
            context_->run();
        } catch (const std::exception& e) {
            logError("[NetService] handler threw: ", e.what(), "; resuming\n");
        }
    }
}

} // namespace colourlink::net
