#include "signage/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace signage::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<bool> verbose{false};

void dispatch(const LogHandler& selected, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = selected;
    }
    // Called outside the lock so a handler may log or swap handlers itself.
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setVerbose(bool enabled) {
    verbose.store(enabled, std::memory_order_relaxed);
}

bool isVerbose() {
    return verbose.load(std::memory_order_relaxed);
}

void logInfo(std::string_view message) {
    dispatch(infoHandler, message);
}

void logError(std::string_view message) {
    dispatch(errorHandler, message);
}

void logDebug(std::string_view message) {
    if (!isVerbose()) {
        return;
    }
    dispatch(infoHandler, message);
}

} // namespace signage::log
