#include "colourlink/log/Log.hpp"

#include <cstdio>
#include <mutex>

namespace colourlink::log {

namespace {

enum class Channel { Info, Error };

// stdout for info, stderr for errors; each message is flushed as written so
// interleaved worker output keeps its order.
LogHandler consoleSink(Channel channel) {
    std::FILE* stream = channel == Channel::Info ? stdout : stderr;
    return [stream](std::string_view message) {
        std::fwrite(message.data(), 1, message.size(), stream);
        std::fflush(stream);
    };
}

struct Sinks {
    std::mutex mutex;
    LogHandler info = consoleSink(Channel::Info);
    LogHandler error = consoleSink(Channel::Error);

    void install(LogHandler newInfo, LogHandler newError) {
        std::lock_guard lock(mutex);
        info = newInfo ? std::move(newInfo) : consoleSink(Channel::Info);
        error = newError ? std::move(newError) : consoleSink(Channel::Error);
    }

    LogHandler current(Channel channel) {
        std::lock_guard lock(mutex);
        return channel == Channel::Info ? info : error;
    }
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

// The handler is copied out so a slow sink never holds the lock.
void dispatch(Channel channel, std::string_view message) {
    if (auto handler = sinks().current(channel)) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    sinks().install(std::move(handler), sinks().current(Channel::Error));
}

void setErrorLogHandler(LogHandler handler) {
    sinks().install(sinks().current(Channel::Info), std::move(handler));
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    sinks().install(std::move(infoHandler), std::move(errorHandler));
}

void resetLogHandlers() {
    sinks().install(nullptr, nullptr);
}

void logInfo(std::string_view message) {
    dispatch(Channel::Info, message);
}

void logError(std::string_view message) {
    dispatch(Channel::Error, message);
}

ScopedLogHandlers::ScopedLogHandlers(LogHandler infoHandler, LogHandler errorHandler)
: previousInfo_(sinks().current(Channel::Info))
, previousError_(sinks().current(Channel::Error))
{
    setLogHandlers(std::move(infoHandler), std::move(errorHandler));
}

ScopedLogHandlers::~ScopedLogHandlers() {
    setLogHandlers(std::move(previousInfo_), std::move(previousError_));
}

} // namespace colourlink::log
