#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace signage::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

/// Debug messages go to the info handler, but only while verbose is on.
void setVerbose(bool enabled);
bool isVerbose();

void logInfo(std::string_view message);
void logError(std::string_view message);
void logDebug(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableVariadic = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(std::string_view{detail::buildLogMessage(std::forward<First>(first),
                                                     std::forward<Rest>(rest)...)});
}

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(std::string_view{detail::buildLogMessage(std::forward<First>(first),
                                                      std::forward<Rest>(rest)...)});
}

template<typename First, typename... Rest, typename = detail::EnableVariadic<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!isVerbose()) {
        return; // skip formatting entirely
    }
    logDebug(std::string_view{detail::buildLogMessage(std::forward<First>(first),
                                                      std::forward<Rest>(rest)...)});
}

} // namespace signage::log

namespace signage {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setVerbose;
using log::logInfo;
using log::logError;
using log::logDebug;
} // namespace signage
