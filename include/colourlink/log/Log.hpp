#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace colourlink::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logError(std::string_view message);

/**
 * @brief RAII helper that installs handlers and restores the previous pair on exit.
 *
 * Tests use it to capture or silence output for one scope.
 */
class ScopedLogHandlers {
public:
    ScopedLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
    ~ScopedLogHandlers();

    ScopedLogHandlers(const ScopedLogHandlers&) = delete;
    ScopedLogHandlers& operator=(const ScopedLogHandlers&) = delete;

private:
    LogHandler previousInfo_;
    LogHandler previousError_;
};

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(std::string_view{msg});
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(std::string_view{msg});
}

} // namespace colourlink::log

namespace colourlink {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
} // namespace colourlink
